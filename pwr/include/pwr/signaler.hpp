// signaler.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pwr {
class signaler {
private:
  bool _open;
  std::mutex _m;
  std::condition_variable _cv;

public:
  explicit signaler(bool initial_state = true);

  void post();
  void reset();
  // returns true if woken by post() before the timeout
  bool wait_for(const std::chrono::nanoseconds &ns);
};
} // namespace pwr
