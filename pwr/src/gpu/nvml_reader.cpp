#include "nvml_impl.hpp"

#include <pwr/log.hpp>

namespace {
pwr::reader::unit_table nvml_units() {
  using namespace pwr;
  return {{quantity::energy, units::millijoules()},
          {quantity::temperature, units::celsius()},
          {quantity::power, units::milliwatts()}};
}
} // namespace

namespace pwr {
nvml_reader::nvml_reader(const std::vector<quantity> &q, quantity_policy policy)
    : reader(nvml_units(), q, policy), _source(std::make_unique<impl>()) {
  log::logline(log::info, "NVML reader initialized with %zu devices",
               _source->num_devices());
}

nvml_reader::nvml_reader(std::unique_ptr<device_source> source,
                         const std::vector<quantity> &q,
                         quantity_policy policy)
    : reader(nvml_units(), q, policy), _source(std::move(source)) {
  if (!_source)
    throw exception(errc::invalid_reader);
}

nvml_reader::~nvml_reader() = default;

std::vector<std::string> nvml_reader::tags() const {
  std::vector<std::string> retval;
  for (size_t ix = 0; ix < num_devices(); ix++)
    retval.push_back("gpu-" + std::to_string(ix));
  return retval;
}

readings nvml_reader::read() {
  readings retval;
  retval.reserve(quantities().size() * num_devices());
  for (quantity q : quantities())
    for (size_t ix = 0; ix < num_devices(); ix++)
      retval.push_back(read_on_device(q, ix));
  return retval;
}

std::string nvml_reader::name() const { return "nvmlreader"; }

size_t nvml_reader::num_devices() const noexcept {
  return _source->num_devices();
}

double nvml_reader::read_on_device(quantity q, size_t idx) const {
  if (idx >= num_devices()) {
    log::logline(log::error, "device index %zu out of range", idx);
    return 0.0;
  }
  auto value = _source->read(q, idx);
  if (!value) {
    log::logline(log::error, "failed to get %s for device %zu: %s",
                 to_string(q), idx, value.error().message().c_str());
    return 0.0;
  }
  return *value;
}
} // namespace pwr
