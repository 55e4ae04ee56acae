// log.hpp

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pwr {
class log {
private:
  log() = default;

public:
  enum level { debug, info, success, warning, error };

  struct loc {
    const char *file;
    int line;
    explicit operator bool() const;
  };

  struct content {
    std::string msg;

    template <typename... Args>
    content(const char *fmt, const Args &...args) : msg() {
      init(fmt, args...);
    }

    explicit operator bool() const;

  private:
    void init(const char *, ...);
  };

  // quiet: only errors, to stderr
  // path: write every level to the file, duplicating errors to stderr
  static void init(bool quiet = false, const std::string &path = "",
                   level min_level = debug);

  static void write(level lvl, const content &cnt, loc at);

  static std::optional<level> level_from_string(std::string_view);

#define logline(lvl, ...) write((lvl), {__VA_ARGS__}, {__FILE__, __LINE__})
};
} // namespace pwr
