// nvml_reader.hpp

#pragma once

#include <pwr/reader.hpp>

#include <memory>
#include <string>
#include <vector>

namespace pwr {
// NVIDIA GPUs through NVML; energy in mJ, temperature in C, power in mW
class nvml_reader final : public reader {
public:
  // per-device queries; the NVML session is the default source
  class device_source {
  public:
    virtual ~device_source() = default;

    virtual size_t num_devices() const noexcept = 0;
    virtual result<double> read(quantity, size_t idx) const noexcept = 0;
  };

private:
  class impl;
  std::unique_ptr<device_source> _source;

public:
  explicit nvml_reader(const std::vector<quantity> & = {quantity::power},
                       quantity_policy = quantity_policy::fail_fast);
  // throws exception(errc::invalid_reader) if the source is null
  nvml_reader(std::unique_ptr<device_source>, const std::vector<quantity> &,
              quantity_policy = quantity_policy::fail_fast);
  ~nvml_reader();

  std::vector<std::string> tags() const override;
  readings read() override;
  std::string name() const override;

  size_t num_devices() const noexcept;

  // zero and a logged error on failure
  double read_on_device(quantity, size_t idx) const;
};
} // namespace pwr
