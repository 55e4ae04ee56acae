// tracker_array.hpp

#pragma once

#include <pwr/tracker.hpp>

#include <memory>
#include <string>
#include <vector>

namespace pwr {
// one tracker per reader, sampled together by a single loop
class tracker_array final : public base_tracker {
private:
  std::vector<std::unique_ptr<tracker>> _trackers;

public:
  // outputs must be empty or hold one path per reader
  explicit tracker_array(std::vector<std::unique_ptr<pwr::reader>> readers,
                         duration dt_read = default_dt_read,
                         duration dt_write = default_dt_write,
                         const std::vector<std::string> &outputs = {});
  ~tracker_array();

  duration read() override;

  void write_header() override;
  void write(bool header = true) override;

  size_t size() const noexcept;
  tracker &operator[](size_t idx);
  const tracker &operator[](size_t idx) const;
};
} // namespace pwr
