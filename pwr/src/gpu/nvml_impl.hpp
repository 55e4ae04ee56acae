#pragma once

#include "../gpu_category.hpp"
#include "gpu_handle.hpp"

#include <pwr/nvml_reader.hpp>

#include <vector>

namespace pwr {
// library session, one per reader
struct lib_handle {
  lib_handle();
  ~lib_handle();

  lib_handle(const lib_handle &) = delete;
  lib_handle &operator=(const lib_handle &) = delete;
};

// constructor and read() are implemented once per GPU backend
class nvml_reader::impl final : public nvml_reader::device_source {
private:
  lib_handle _lib;
  std::vector<gpu_handle> _devices;

public:
  impl();

  size_t num_devices() const noexcept override { return _devices.size(); }

  result<double> read(quantity, size_t idx) const noexcept override;
};
} // namespace pwr
