// reader.cpp

#include <pwr/log.hpp>
#include <pwr/reader.hpp>

#include <algorithm>
#include <sstream>

namespace {
pwr::matrix as_column(const pwr::series &s) {
  pwr::matrix retval;
  retval.reserve(s.size());
  for (double v : s)
    retval.push_back({v});
  return retval;
}

pwr::series first_column(const pwr::matrix &m) {
  pwr::series retval;
  retval.reserve(m.size());
  for (const auto &row : m)
    retval.push_back(row.empty() ? 0.0 : row.front());
  return retval;
}

std::string supported_list(const pwr::reader::unit_table &units) {
  std::ostringstream oss;
  for (size_t ix = 0; ix < units.size(); ix++)
    oss << (ix ? ", " : "") << units[ix].first;
  return oss.str();
}
} // namespace

namespace pwr {
const char *to_string(quantity_policy p) noexcept {
  switch (p) {
  case quantity_policy::fail_fast:
    return "fail-fast";
  case quantity_policy::log_and_skip:
    return "log-and-skip";
  }
  return "unknown";
}

reader::reader(unit_table supported, const std::vector<quantity> &requested,
               quantity_policy policy)
    : _units(std::move(supported)), _quantities(), _policy(policy) {
  for (quantity q : requested) {
    if (!supports(q)) {
      if (_policy == quantity_policy::fail_fast) {
        log::logline(log::error, "invalid quantity requested: %s; supported: %s",
                     to_string(q), supported_list(_units).c_str());
        throw exception(errc::unsupported_quantity);
      }
      log::logline(log::warning,
                   "invalid quantity requested: %s; supported: %s; skipping",
                   to_string(q), supported_list(_units).c_str());
      continue;
    }
    if (std::find(_quantities.begin(), _quantities.end(), q) ==
        _quantities.end())
      _quantities.push_back(q);
  }
}

unit reader::get_unit(quantity q) const {
  auto it = std::find_if(_units.begin(), _units.end(),
                         [q](const auto &entry) { return entry.first == q; });
  if (it != _units.end())
    return it->second;
  log::logline(log::warning, "invalid quantity requested: %s; supported: %s",
               to_string(q), supported_list(_units).c_str());
  return unit{};
}

bool reader::supports(quantity q) const noexcept {
  return std::any_of(_units.begin(), _units.end(),
                     [q](const auto &entry) { return entry.first == q; });
}

const std::vector<quantity> &reader::quantities() const noexcept {
  return _quantities;
}

quantity_policy reader::policy() const noexcept { return _policy; }

bool reader::energy_without_power() const noexcept {
  auto has = [this](quantity q) {
    return std::find(_quantities.begin(), _quantities.end(), q) !=
           _quantities.end();
  };
  return has(quantity::energy) && !has(quantity::power);
}

matrix reader::compute_energy_delta(const matrix &energy) const {
  matrix retval;
  if (energy.size() < 2)
    return retval;
  retval.reserve(energy.size() - 1);
  for (size_t row = 1; row < energy.size(); row++) {
    const auto &curr = energy[row];
    const auto &prev = energy[row - 1];
    readings delta(curr.size(), 0.0);
    for (size_t col = 0; col < curr.size() && col < prev.size(); col++)
      delta[col] = curr[col] - prev[col];
    retval.push_back(std::move(delta));
  }
  return retval;
}

series reader::compute_energy_delta(const series &energy) const {
  return first_column(compute_energy_delta(as_column(energy)));
}

matrix reader::compute_power_series(const series &time_s,
                                    const matrix &energy) const {
  size_t n = std::min(time_s.size(), energy.size());
  size_t cols = n ? energy.front().size() : 0;
  matrix power(n, readings(cols, 0.0));
  if (n < 2)
    return power;

  double factor = get_unit(quantity::energy).to_si();
  matrix delta =
      compute_energy_delta(matrix(energy.begin(), energy.begin() + n));
  // power[i] is the mean power over [t_i, t_i+1]; the last row stays zero
  for (size_t row = 0; row + 1 < n; row++) {
    double dt = time_s[row + 1] - time_s[row];
    if (dt <= 0.0) {
      log::logline(log::warning,
                   "non-increasing timestamps at sample %zu; power set to 0",
                   row);
      continue;
    }
    for (size_t col = 0; col < cols && col < delta[row].size(); col++)
      power[row][col] = factor * delta[row][col] / dt;
  }
  return power;
}

series reader::compute_power_series(const series &time_s,
                                    const series &energy) const {
  return first_column(compute_power_series(time_s, as_column(energy)));
}
} // namespace pwr
