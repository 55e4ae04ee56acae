// tracker.cpp

#include <pwr/log.hpp>
#include <pwr/forced_exit.hpp>
#include <pwr/tracker.hpp>

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

using namespace pwr;

namespace {
constexpr char timestamp_format[] = "%Y-%m-%d_%H:%M:%S";
constexpr char header_prefix[] = "# timestamp";

int64_t now_ns() {
  using namespace std::chrono;
  return duration_cast<nanoseconds>(
             base_tracker::clock::now().time_since_epoch())
      .count();
}

double to_seconds(const base_tracker::duration &d) {
  return std::chrono::duration<double>(d).count();
}

void append_to_file(const std::string &path, const std::string &text) {
  std::ofstream file(path, std::ios::app);
  if (!file)
    throw exception(std::error_code(errno, std::system_category()),
                    "cannot open " + path);
  file << text;
  file.flush();
  if (!file)
    throw exception(std::error_code(errno, std::system_category()),
                    "error writing to " + path);
}
} // namespace

namespace pwr {
std::string format_timestamp(int64_t ns_since_epoch) {
  std::time_t secs = static_cast<std::time_t>(ns_since_epoch / 1000000000);
  int64_t us = (ns_since_epoch % 1000000000) / 1000;
  if (us < 0) {
    us += 1000000;
    secs -= 1;
  }
  std::tm tm;
  localtime_r(&secs, &tm);
  char buff[64];
  size_t sz = std::strftime(buff, sizeof(buff), timestamp_format, &tm);
  if (!sz)
    return {};
  snprintf(buff + sz, sizeof(buff) - sz, ".%06" PRId64, us);
  return buff;
}

// base_tracker

const base_tracker::duration base_tracker::default_dt_read =
    std::chrono::seconds(1);
const base_tracker::duration base_tracker::default_dt_write =
    std::chrono::seconds(3600);

base_tracker::base_tracker(duration dt_read, duration dt_write)
    : _dt_read(dt_read), _dt_write(dt_write), _future(), _finished(false),
      _exit_requested(false), _sig(false) {
  if (_dt_read <= duration::zero() || _dt_write <= duration::zero())
    throw exception(errc::invalid_interval);
}

base_tracker::~base_tracker() { halt(); }

void base_tracker::start(std::optional<duration> dt_write) {
  if (running()) {
    log::logline(log::warning,
                 "tracker is already running; use stop() to stop it first");
    return;
  }
  _finished = false;
  _sig.reset();
  _future = std::async(std::launch::async,
                       [this, dt_write]() { update_series(dt_write); });
  log::logline(log::debug, "tracker started, reading every %.3e s",
               to_seconds(_dt_read));
}

void base_tracker::stop() {
  if (!running()) {
    log::logline(log::warning, "tracker is not running; nothing to stop");
    return;
  }
  _finished = true;
  _sig.post();
  // rethrows anything that escaped the sampling loop
  _future.get();
  log::logline(log::debug, "tracker stopped");
}

bool base_tracker::running() const noexcept { return _future.valid(); }

void base_tracker::halt() noexcept {
  if (!running())
    return;
  _finished = true;
  _sig.post();
  try {
    _future.get();
  } catch (const std::exception &e) {
    log::logline(log::error, "sampling loop terminated with error: %s",
                 e.what());
  } catch (...) {
    log::logline(log::error, "sampling loop terminated with unknown error");
  }
}

void base_tracker::track_until_forced_exit(std::optional<duration> dt_write) {
  if (running()) {
    log::logline(log::warning,
                 "tracker is running in the background; use stop() first");
    return;
  }
  write_header();
  try {
    auto next_write = clock::now() + dt_write.value_or(duration::zero());
    while (!exit_requested()) {
      read_and_sleep();
      if (dt_write) {
        auto now = clock::now();
        if (now >= next_write) {
          write(false);
          next_write = now + *dt_write;
        }
      }
    }
  } catch (const std::exception &e) {
    log::logline(log::error, "tracking interrupted by error: %s", e.what());
    final_write();
    throw;
  } catch (...) {
    log::logline(log::error, "tracking interrupted by unknown error");
    final_write();
    throw;
  }
  _exit_requested = false;
  log::logline(log::info, "forced exit detected; stopping tracker");
  write(false);
}

void base_tracker::request_exit() noexcept {
  _exit_requested = true;
  _sig.post();
}

const base_tracker::duration &base_tracker::dt_read() const noexcept {
  return _dt_read;
}

const base_tracker::duration &base_tracker::dt_write() const noexcept {
  return _dt_write;
}

void base_tracker::read_and_sleep() {
  duration elapsed = read();
  if (elapsed < _dt_read)
    _sig.wait_for(_dt_read - elapsed);
  else
    log::logline(log::warning,
                 "time taken for reading (%.3e s) exceeds the read interval "
                 "(%.3e s); please increase the interval",
                 to_seconds(elapsed), to_seconds(_dt_read));
}

void base_tracker::update_series(std::optional<duration> dt_write) {
  auto next_write = clock::now() + dt_write.value_or(duration::zero());
  while (!_finished) {
    read_and_sleep();
    if (dt_write) {
      auto now = clock::now();
      if (now >= next_write) {
        write(false);
        next_write = now + *dt_write;
      }
    }
  }
}

void base_tracker::final_write() noexcept {
  _exit_requested = false;
  try {
    write(false);
  } catch (const std::exception &e) {
    log::logline(log::error, "final write failed: %s", e.what());
  } catch (...) {
    log::logline(log::error, "final write failed with unknown error");
  }
}

bool base_tracker::exit_requested() const noexcept {
  return _exit_requested || forced_exit::requested();
}

// tracker

tracker::tracker(std::unique_ptr<pwr::reader> r, duration dt_read,
                 duration dt_write, std::string output)
    : base_tracker(dt_read, dt_write), _reader(std::move(r)),
      _output(std::move(output)), _mtx(), _time_series(), _reading_time(),
      _data() {
  if (!_reader)
    throw exception(errc::invalid_reader);
  if (_output.empty())
    _output = _reader->name() + "_series.log";
}

tracker::~tracker() { halt(); }

tracker::duration tracker::read() {
  int64_t t0 = now_ns();
  readings data = _reader->read();
  int64_t t1 = now_ns();

  int64_t timestamp = t0 + (t1 - t0) / 2;
  int64_t elapsed = t1 - t0;
  log::logline(log::debug, "read completed in %.3e s", elapsed * 1e-9);

  {
    std::scoped_lock lock(_mtx);
    _time_series.push_back(timestamp);
    _reading_time.push_back(elapsed);
    _data.push_back(std::move(data));
  }
  return duration(now_ns() - t0);
}

flushed_data tracker::flush_data() {
  flushed_data retval;
  {
    std::scoped_lock lock(_mtx);
    retval.time_series.assign(_time_series.begin(), _time_series.end());
    retval.reading_time.assign(_reading_time.begin(), _reading_time.end());
    retval.data.assign(std::make_move_iterator(_data.begin()),
                       std::make_move_iterator(_data.end()));
    _time_series.clear();
    _reading_time.clear();
    _data.clear();
  }
  if (_reader->energy_without_power())
    append_power(retval);
  return retval;
}

void tracker::append_power(flushed_data &fd) const {
  const auto &quantities = _reader->quantities();
  size_t ntags = _reader->tags().size();
  size_t offset =
      (std::find(quantities.begin(), quantities.end(), quantity::energy) -
       quantities.begin()) *
      ntags;

  int64_t t0 = fd.time_series.empty() ? 0 : fd.time_series.front();
  series time_s;
  matrix energy;
  time_s.reserve(fd.data.size());
  energy.reserve(fd.data.size());
  for (size_t row = 0; row < fd.data.size(); row++) {
    time_s.push_back((fd.time_series[row] - t0) * 1e-9);
    readings values(ntags, 0.0);
    for (size_t col = 0; col < ntags && offset + col < fd.data[row].size();
         col++)
      values[col] = fd.data[row][offset + col];
    energy.push_back(std::move(values));
  }

  matrix power = _reader->compute_power_series(time_s, energy);
  for (size_t row = 0; row < power.size(); row++)
    fd.data[row].insert(fd.data[row].end(), power[row].begin(),
                        power[row].end());
}

void tracker::write_header() {
  std::string ts = format_timestamp(now_ns());
  size_t prefix_len = sizeof(header_prefix) - 3;
  std::ostringstream oss;
  oss << header_prefix
      << std::string(ts.size() > prefix_len ? ts.size() - prefix_len : 0, ' ');
  oss << " reading-time[ns]";
  for (const auto &tag : column_tags())
    oss << " " << tag;
  oss << "\n";
  append_to_file(_output, oss.str());
}

void tracker::write(bool header) {
  if (header)
    write_header();
  write_data(flush_data());
}

void tracker::write_data(const flushed_data &fd) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::digits10);
  size_t rows = std::min({fd.time_series.size(), fd.reading_time.size(),
                          fd.data.size()});
  for (size_t row = 0; row < rows; row++) {
    oss << "  " << format_timestamp(fd.time_series[row]) << " "
        << fd.reading_time[row];
    for (double v : fd.data[row])
      oss << " " << v;
    oss << "\n";
  }
  append_to_file(_output, oss.str());
  log::logline(log::debug, "wrote %zu samples to %s", rows, _output.c_str());
}

std::vector<std::string> tracker::column_tags() const {
  std::vector<std::string> retval;
  std::vector<std::string> tags = _reader->tags();
  for (quantity q : _reader->quantities()) {
    std::string label = _reader->get_unit(q).label();
    for (const auto &tag : tags)
      retval.push_back(tag + "[" + label + "]");
  }
  if (_reader->energy_without_power())
    for (const auto &tag : tags)
      retval.push_back(tag + "[" + units::watts().label() + "]");
  return retval;
}

std::array<size_t, 3> tracker::buffer_sizes() const {
  std::scoped_lock lock(_mtx);
  return {_time_series.size(), _reading_time.size(), _data.size()};
}

const std::string &tracker::output() const noexcept { return _output; }

const reader &tracker::reader() const noexcept { return *_reader; }

// scoped_tracking

scoped_tracking::scoped_tracking(base_tracker &t) : _tracker(t) {
  _tracker.write_header();
  _tracker.start(_tracker.dt_write());
}

scoped_tracking::~scoped_tracking() {
  try {
    _tracker.stop();
  } catch (const std::exception &e) {
    log::logline(log::error, "error stopping tracker: %s", e.what());
  } catch (...) {
    log::logline(log::error, "unknown error stopping tracker");
  }
  try {
    _tracker.write(false);
  } catch (const std::exception &e) {
    log::logline(log::error, "error writing tracker data: %s", e.what());
  } catch (...) {
    log::logline(log::error, "unknown error writing tracker data");
  }
}
} // namespace pwr
