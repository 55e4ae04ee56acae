// signaler.cpp

#include <pwr/signaler.hpp>

using namespace pwr;

signaler::signaler(bool initial_state) : _open(initial_state), _m(), _cv() {}

void signaler::post() {
  {
    std::lock_guard lock(_m);
    _open = true;
  }
  _cv.notify_one();
}

void signaler::reset() {
  std::lock_guard lock(_m);
  _open = false;
}

bool signaler::wait_for(const std::chrono::nanoseconds &ns) {
  std::unique_lock lock(_m);
  bool posted = _cv.wait_for(lock, ns, [this] { return _open; });
  _open = false;
  return posted;
}
