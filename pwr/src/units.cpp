// units.cpp

#include <pwr/units.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <utility>

namespace {
constexpr std::array<std::pair<pwr::quantity, const char *>, 3> quantity_names =
    {{
        {pwr::quantity::energy, "energy"},
        {pwr::quantity::power, "power"},
        {pwr::quantity::temperature, "temperature"},
    }};

constexpr std::array<std::pair<std::string_view, double>, 4> label_factors = {{
    {"uJ", 1e-6},
    {"mJ", 1e-3},
    {"J", 1.0},
    {"kWh", 3600000.0},
}};

bool iequals(std::string_view lhs, std::string_view rhs) {
  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                    [](unsigned char a, unsigned char b) {
                      return std::tolower(a) == std::tolower(b);
                    });
}
} // namespace

namespace pwr {
const char *to_string(quantity q) noexcept {
  for (const auto &[key, name] : quantity_names)
    if (key == q)
      return name;
  return "unknown";
}

result<quantity> quantity_from_string(std::string_view str) {
  for (const auto &[key, name] : quantity_names)
    if (iequals(str, name))
      return key;
  return result<quantity>(nonstd::unexpect, errc::unsupported_quantity);
}

std::ostream &operator<<(std::ostream &os, quantity q) {
  return os << to_string(q);
}

unit::unit() : _label(), _factor(1.0) {}

unit::unit(std::string label, double factor)
    : _label(std::move(label)), _factor(factor) {
  if (!(_factor > 0.0))
    throw exception(errc::invalid_unit);
}

const std::string &unit::label() const noexcept { return _label; }

double unit::to_si() const noexcept { return _factor; }

bool unit::operator==(const unit &rhs) const noexcept {
  return _label == rhs._label && _factor == rhs._factor;
}

bool unit::operator!=(const unit &rhs) const noexcept {
  return !(*this == rhs);
}

std::ostream &operator<<(std::ostream &os, const unit &u) {
  return os << u.label();
}

namespace units {
unit microjoules() { return unit::from_ratio<std::micro>("uJ"); }
unit millijoules() { return unit::from_ratio<std::milli>("mJ"); }
unit joules() { return unit::from_ratio<std::ratio<1>>("J"); }
unit milliwatts() { return unit::from_ratio<std::milli>("mW"); }
unit watts() { return unit::from_ratio<std::ratio<1>>("W"); }
unit celsius() { return unit("C", 1.0); }
} // namespace units

double conversion_factor(std::string_view label) noexcept {
  for (const auto &[key, factor] : label_factors)
    if (key == label)
      return factor;
  return 1.0;
}
} // namespace pwr
