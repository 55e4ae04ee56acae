// error.cpp
#include "gpu_category.hpp"

#include <pwr/error.hpp>

namespace {
struct generic_category_t : std::error_category {
  const char *name() const noexcept override;
  std::string message(int) const override;
  std::error_condition default_error_condition(int) const noexcept override;
};

struct error_cause_category_t : std::error_category {
  const char *name() const noexcept override;
  std::string message(int) const override;
  bool equivalent(const std::error_code &, int) const noexcept override;
};

const generic_category_t generic_category_v;
const error_cause_category_t error_cause_category_v;
const pwr::gpu_category_t gpu_category_v;

const char *generic_category_t::name() const noexcept { return "pwr-lib"; }

std::string generic_category_t::message(int ev) const {
  using pwr::errc;
  switch (static_cast<errc>(ev)) {
  case errc::not_implemented:
    return "feature not implemented";
  case errc::no_devices_found:
    return "no devices were found";
  case errc::no_such_device:
    return "no such device exists";
  case errc::unsupported_quantity:
    return "quantity not supported by reader";
  case errc::invalid_unit:
    return "unit conversion factor must be positive";
  case errc::invalid_interval:
    return "tracking interval must be positive";
  case errc::invalid_reader:
    return "tracker requires a reader";
  case errc::invalid_output_count:
    return "number of outputs must be zero or equal to the number of readers";
  case errc::readings_not_valid:
    return "counter readings are not valid";
  case errc::counter_not_open:
    return "counter file is not open";
  case errc::unknown_error:
    return "unknown error";
  }
  return "(unrecognized pwr error code)";
}

std::error_condition
generic_category_t::default_error_condition(int ev) const noexcept {
  using pwr::errc;
  using pwr::error_cause;
  switch (static_cast<errc>(ev)) {
  case errc::no_devices_found:
  case errc::unsupported_quantity:
    return error_cause::setup_error;
  case errc::no_such_device:
    return error_cause::query_error;
  case errc::readings_not_valid:
  case errc::counter_not_open:
    return error_cause::read_error;
  case errc::invalid_unit:
  case errc::invalid_interval:
  case errc::invalid_reader:
  case errc::invalid_output_count:
    return error_cause::invalid_argument;
  case errc::not_implemented:
    return error_cause::other;
  case errc::unknown_error:
    return error_cause::unknown;
  }
  return error_cause::unknown;
}

const char *error_cause_category_t::name() const noexcept {
  return "error-cause";
}

std::string error_cause_category_t::message(int ev) const {
  using pwr::error_cause;
  switch (static_cast<error_cause>(ev)) {
  case error_cause::gpu_lib_error:
    return "GPU library error";
  case error_cause::setup_error:
    return "error during reader setup";
  case error_cause::query_error:
    return "error querying value";
  case error_cause::read_error:
    return "error reading counters";
  case error_cause::system_error:
    return "system error";
  case error_cause::invalid_argument:
    return "invalid argument";
  case error_cause::other:
    return "other error";
  case error_cause::unknown:
    return "unknown error cause";
  }
  return "(unrecognized error condition)";
}

bool error_cause_category_t::equivalent(const std::error_code &ec,
                                        int cv) const noexcept {
  using pwr::error_cause;
  auto cond = static_cast<error_cause>(cv);
  if (ec.category() == std::system_category())
    return cond == error_cause::system_error;
  if (ec.category() == pwr::gpu_category())
    return cond == error_cause::gpu_lib_error;
  if (ec.category() == pwr::generic_category())
    return cond == ec.category().default_error_condition(ec.value());
  return false;
}
} // namespace

namespace pwr {
const char *gpu_category_t::name() const noexcept { return "pwr-gpu"; }

std::error_condition
gpu_category_t::default_error_condition(int ev) const noexcept {
  return std::error_condition(ev, *this);
}

std::error_code make_error_code(errc x) noexcept {
  return std::error_code{static_cast<int>(x), generic_category()};
}

std::error_condition make_error_condition(error_cause x) noexcept {
  return std::error_condition{static_cast<int>(x), error_cause_category_v};
}

const std::error_category &generic_category() noexcept {
  return generic_category_v;
}

const std::error_category &gpu_category() noexcept { return gpu_category_v; }
} // namespace pwr
