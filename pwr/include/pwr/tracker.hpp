// tracker.hpp

#pragma once

#include <pwr/reader.hpp>
#include <pwr/signaler.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pwr {
// base_tracker

// idle until start(), running until stop(); at most one background task
class base_tracker {
public:
  using clock = std::chrono::system_clock;
  using duration = std::chrono::nanoseconds;

  static const duration default_dt_read;
  static const duration default_dt_write;

private:
  duration _dt_read;
  duration _dt_write;
  std::future<void> _future;
  std::atomic_bool _finished;
  std::atomic_bool _exit_requested;
  signaler _sig;

public:
  explicit base_tracker(duration dt_read = default_dt_read,
                        duration dt_write = default_dt_write);
  virtual ~base_tracker();

  base_tracker(const base_tracker &) = delete;
  base_tracker &operator=(const base_tracker &) = delete;

  // reads once, returns the time taken including buffering
  virtual duration read() = 0;

  virtual void write_header() = 0;
  virtual void write(bool header = true) = 0;

  void start(std::optional<duration> dt_write = std::nullopt);
  void stop();
  bool running() const noexcept;

  // samples on the calling thread until request_exit() or a forced exit;
  // a request made before the call ends it after the header is written
  void track_until_forced_exit(std::optional<duration> dt_write = std::nullopt);
  void request_exit() noexcept;

  const duration &dt_read() const noexcept;
  const duration &dt_write() const noexcept;

protected:
  void read_and_sleep();

  // stops without throwing; derived destructors must call this
  void halt() noexcept;

private:
  void update_series(std::optional<duration> dt_write);
  void final_write() noexcept;
  bool exit_requested() const noexcept;
};

// tracker

struct flushed_data {
  std::vector<int64_t> time_series;
  std::vector<int64_t> reading_time;
  matrix data;
};

class tracker final : public base_tracker {
private:
  std::unique_ptr<pwr::reader> _reader;
  std::string _output;
  mutable std::mutex _mtx;
  std::deque<int64_t> _time_series;
  std::deque<int64_t> _reading_time;
  std::deque<readings> _data;

public:
  explicit tracker(std::unique_ptr<pwr::reader> r,
                   duration dt_read = default_dt_read,
                   duration dt_write = default_dt_write,
                   std::string output = "");
  ~tracker();

  duration read() override;

  // empties the buffer; appends derived power columns if needed
  flushed_data flush_data();

  void write_header() override;
  void write(bool header = true) override;
  void write_data(const flushed_data &);

  // <tag>[<unit>] per data column
  std::vector<std::string> column_tags() const;

  std::array<size_t, 3> buffer_sizes() const;

  const std::string &output() const noexcept;
  const pwr::reader &reader() const noexcept;

private:
  void append_power(flushed_data &) const;
};

// stop(), flush and write on every exit path from the enclosing scope
class scoped_tracking {
private:
  base_tracker &_tracker;

public:
  explicit scoped_tracking(base_tracker &);
  ~scoped_tracking();

  scoped_tracking(const scoped_tracking &) = delete;
  scoped_tracking &operator=(const scoped_tracking &) = delete;
};

std::string format_timestamp(int64_t ns_since_epoch);
} // namespace pwr
