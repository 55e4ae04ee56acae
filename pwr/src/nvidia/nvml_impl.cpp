#include "../gpu/nvml_impl.hpp"

#include <pwr/log.hpp>

#include <nvml.h>

namespace {
std::error_code make_error_code(nvmlReturn_t status) {
  return {static_cast<int>(status), pwr::gpu_category()};
}

pwr::result<unsigned int> get_device_count() {
  using rettype = decltype(get_device_count());
  unsigned int devcount;
  nvmlReturn_t result = nvmlDeviceGetCount(&devcount);
  if (result != NVML_SUCCESS)
    return rettype(nonstd::unexpect, make_error_code(result));
  return devcount;
}

pwr::result<double> read_energy(nvmlDevice_t handle) noexcept {
  unsigned long long energy;
  nvmlReturn_t result = nvmlDeviceGetTotalEnergyConsumption(handle, &energy);
  if (result != NVML_SUCCESS)
    return pwr::result<double>(nonstd::unexpect, make_error_code(result));
  return static_cast<double>(energy);
}

pwr::result<double> read_temperature(nvmlDevice_t handle) noexcept {
  unsigned int temp;
  nvmlReturn_t result =
      nvmlDeviceGetTemperature(handle, NVML_TEMPERATURE_GPU, &temp);
  if (result != NVML_SUCCESS)
    return pwr::result<double>(nonstd::unexpect, make_error_code(result));
  return static_cast<double>(temp);
}

pwr::result<double> read_power(nvmlDevice_t handle) noexcept {
  unsigned int power;
  nvmlReturn_t result = nvmlDeviceGetPowerUsage(handle, &power);
  if (result != NVML_SUCCESS)
    return pwr::result<double>(nonstd::unexpect, make_error_code(result));
  return static_cast<double>(power);
}
} // namespace

namespace pwr {
std::string gpu_category_t::message(int ev) const {
  return nvmlErrorString(static_cast<nvmlReturn_t>(ev));
}

lib_handle::lib_handle() {
  nvmlReturn_t result = nvmlInit();
  if (result != NVML_SUCCESS)
    throw exception(::make_error_code(result), "failed to initialize NVML");
  log::logline(log::info, "NVML initialized successfully");
}

lib_handle::~lib_handle() {
  nvmlReturn_t result = nvmlShutdown();
  if (result != NVML_SUCCESS)
    log::logline(log::error, "failed to shutdown NVML: %s",
                 nvmlErrorString(result));
}

nvml_reader::impl::impl() : _lib(), _devices() {
  auto device_cnt = get_device_count();
  if (!device_cnt)
    throw exception(device_cnt.error());
  for (unsigned int i = 0; i < *device_cnt; i++) {
    constexpr size_t sz = NVML_DEVICE_NAME_BUFFER_SIZE;
    char name[sz];
    nvmlDevice_t handle = nullptr;
    if (nvmlReturn_t res;
        (res = nvmlDeviceGetHandleByIndex(i, &handle)) != NVML_SUCCESS) {
      log::logline(log::error, "failed to get handle for device %u: %s", i,
                   nvmlErrorString(res));
      continue;
    }
    if (nvmlReturn_t res;
        (res = nvmlDeviceGetName(handle, name, sz)) != NVML_SUCCESS)
      log::logline(log::info, "handle for device %u initialized", i);
    else
      log::logline(log::info, "handle for device %u initialized, name: %s", i,
                   name);
    _devices.push_back(handle);
  }
}

result<double> nvml_reader::impl::read(quantity q, size_t idx) const noexcept {
  if (idx >= _devices.size())
    return result<double>(nonstd::unexpect, errc::no_such_device);
  switch (q) {
  case quantity::energy:
    return read_energy(_devices[idx]);
  case quantity::temperature:
    return read_temperature(_devices[idx]);
  case quantity::power:
    return read_power(_devices[idx]);
  }
  return result<double>(nonstd::unexpect, errc::unsupported_quantity);
}
} // namespace pwr
