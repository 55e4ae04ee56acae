#include <pwr/log.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

using namespace pwr;

namespace {
using write_func_ptr = void (*)(const log::content &, log::loc);

constexpr const char error_message[] = "<log error>";

constexpr const std::array<const char *, 5> levels = {"debug", "info",
                                                      "success", "warn",
                                                      "error"};

constexpr const std::array<const char *, 5> level_names = {
    "debug", "info", "success", "warning", "error"};

std::mutex _logmtx;
std::ofstream _stream;

class timestamp {
  char buff[128];

public:
  timestamp() {
    using namespace std::chrono;
    system_clock::time_point stp(system_clock::now());
    microseconds us = duration_cast<microseconds>(stp.time_since_epoch());
    seconds sec = duration_cast<seconds>(us);
    std::tm tm;
    std::time_t time = sec.count();
    localtime_r(&time, &tm);
    size_t tm_sz = std::strftime(buff, sizeof(buff), "%T", &tm);
    if (!tm_sz) {
      *buff = 0;
      return;
    }
    int written =
        snprintf(buff + tm_sz, sizeof(buff) - tm_sz, ".%06" PRId64,
                 static_cast<int64_t>(us.count() % microseconds::period::den));
    if (written < 0 ||
        static_cast<unsigned>(written) >= sizeof(buff) - tm_sz) {
      *buff = 0;
      return;
    }
  }

  explicit operator bool() const { return *buff; }

  friend std::ostream &operator<<(std::ostream &os, const timestamp &ts);
};

std::ostream &operator<<(std::ostream &os, const timestamp &ts) {
  return os << ts.buff;
}

std::ostream &operator<<(std::ostream &os, log::loc at) {
  std::ios::fmtflags flags(os.flags());
  const char *file = std::strrchr(at.file, '/');
  os << (file ? file + 1 : at.file) << ":" << std::left << std::setw(3)
     << at.line;
  os.flags(flags);
  return os;
}

std::ostream &operator<<(std::ostream &os, const log::content &cnt) {
  return os << cnt.msg;
}

std::ostream &operator<<(std::ostream &os, log::level lvl) {
  return os << levels[lvl];
}

void write_single(std::ostream &os, log::level lvl, const log::content &cnt,
                  log::loc at) {
  auto ts = timestamp{};
  if (ts && cnt)
    os << ts << ": " << at << " " << lvl << ": " << cnt << "\n";
  else
    os << error_message << "\n";
}

template <typename... Args>
void write_multiple(log::level lvl, const log::content &cnt, log::loc at,
                    Args &...streams) {
  std::ostringstream oss;
  write_single(oss, lvl, cnt, at);

  std::string str = oss.str();
  auto print = [](std::ostream &os, const std::string &str) {
    os << str;
    os.flush();
  };
  (print(streams, str), ...);
}

template <log::level lvl, bool to_file = false, bool duplicate = false>
void write_impl(const log::content &cnt, log::loc at) {
  static_assert(to_file || !duplicate,
                "If not writing to file, cannot duplicate to std* stream");

  if constexpr (lvl == log::error || lvl == log::warning) {
    if constexpr (to_file) {
      if constexpr (lvl == log::error && duplicate)
        write_multiple(lvl, cnt, at, _stream, std::cerr);
      else
        write_multiple(lvl, cnt, at, _stream);
    } else
      write_single(std::cerr, lvl, cnt, at);
  } else if constexpr (to_file)
    write_multiple(lvl, cnt, at, _stream);
  else
    write_single(std::cout, lvl, cnt, at);
}

void do_nothing(const log::content &, log::loc) {}

std::array<write_func_ptr, 5> funcs = {do_nothing, do_nothing, do_nothing,
                                       do_nothing, do_nothing};

template <bool to_file, bool dup, log::level... lvl>
void set_funcs(std::array<write_func_ptr, 5> &funcs) {
  static_assert(to_file || !dup,
                "If not writing to file, cannot duplicate to std* stream");

  if constexpr (to_file && dup)
    ((funcs[lvl] = write_impl<lvl, true, true>), ...);
  else if constexpr (to_file)
    ((funcs[lvl] = write_impl<lvl, true>), ...);
  else
    ((funcs[lvl] = write_impl<lvl>), ...);
}

std::string error_opening_file(const std::string &file) {
  std::string msg("Error opening file ");
  msg.append(file).append(": ").append(std::strerror(errno));
  return msg;
}

static_assert(funcs.size() == log::error + 1);
static_assert(levels.size() == log::error + 1);
static_assert(level_names.size() == log::error + 1);
} // namespace

namespace pwr {
log::loc::operator bool() const { return file && line; }

void log::content::init(const char *fmt, ...) {
  va_list args;
  va_list args_copy;
  va_start(args, fmt);
  va_copy(args_copy, args);
  int bufsz = std::vsnprintf(nullptr, 0, fmt, args);
  va_end(args);
  if (bufsz < 0) {
    va_end(args_copy);
    return;
  }

  msg.resize(bufsz + 1);
  bufsz = std::vsnprintf(msg.data(), msg.size(), fmt, args_copy);
  va_end(args_copy);
  if (bufsz < 0)
    msg.clear();
  else
    msg.resize(bufsz);
}

log::content::operator bool() const { return !msg.empty(); }

void log::init(bool quiet, const std::string &path, level min_level) {
  static std::once_flag oflag;
  std::call_once(
      oflag,
      [](bool quiet, const std::string &path, level min_level) {
        std::scoped_lock lock(_logmtx);
        if (quiet)
          set_funcs<false, false, error>(funcs);
        else if (path.empty())
          set_funcs<false, false, debug, info, success, warning, error>(funcs);
        else {
          _stream.open(path, std::ios::app);
          if (!_stream)
            throw std::runtime_error(error_opening_file(path));
          set_funcs<true, false, debug, info, success, warning>(funcs);
          set_funcs<true, true, error>(funcs);
        }
        for (int lvl = debug; lvl < min_level && lvl < error; lvl++)
          funcs[lvl] = do_nothing;
      },
      quiet, path, min_level);
}

void log::write(level lvl, const content &cnt, loc at) {
  std::scoped_lock lock(_logmtx);
  (*funcs[lvl])(cnt, at);
}

std::optional<log::level> log::level_from_string(std::string_view str) {
  for (size_t ix = 0; ix < level_names.size(); ix++)
    if (str == level_names[ix] || str == levels[ix])
      return static_cast<level>(ix);
  return std::nullopt;
}
} // namespace pwr
