// tracker_array.cpp

#include <pwr/log.hpp>
#include <pwr/tracker_array.hpp>

using namespace pwr;

tracker_array::tracker_array(std::vector<std::unique_ptr<pwr::reader>> readers,
                             duration dt_read, duration dt_write,
                             const std::vector<std::string> &outputs)
    : base_tracker(dt_read, dt_write), _trackers() {
  if (!outputs.empty() && outputs.size() != readers.size())
    throw exception(errc::invalid_output_count,
                    "expected " + std::to_string(readers.size()) +
                        " outputs, got " + std::to_string(outputs.size()));
  _trackers.reserve(readers.size());
  for (size_t ix = 0; ix < readers.size(); ix++)
    _trackers.push_back(std::make_unique<tracker>(
        std::move(readers[ix]), dt_read, dt_write,
        outputs.empty() ? std::string() : outputs[ix]));
  log::logline(log::debug, "created tracker array with %zu trackers",
               _trackers.size());
}

tracker_array::~tracker_array() { halt(); }

tracker_array::duration tracker_array::read() {
  duration total = duration::zero();
  for (auto &t : _trackers)
    total += t->read();
  return total;
}

void tracker_array::write_header() {
  for (auto &t : _trackers)
    t->write_header();
}

void tracker_array::write(bool header) {
  for (auto &t : _trackers)
    t->write(header);
}

size_t tracker_array::size() const noexcept { return _trackers.size(); }

tracker &tracker_array::operator[](size_t idx) { return *_trackers.at(idx); }

const tracker &tracker_array::operator[](size_t idx) const {
  return *_trackers.at(idx);
}
