// error.hpp

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace pwr {
enum class errc : uint32_t;
enum class error_cause : uint32_t;
} // namespace pwr

namespace std {
template <> struct is_error_code_enum<pwr::errc> : std::true_type {};
template <>
struct is_error_condition_enum<pwr::error_cause> : std::true_type {};
} // namespace std

namespace pwr {
enum class errc : uint32_t {
  not_implemented = 1,
  no_devices_found,
  no_such_device,
  unsupported_quantity,
  invalid_unit,
  invalid_interval,
  invalid_reader,
  invalid_output_count,
  readings_not_valid,
  counter_not_open,
  unknown_error,
};

enum class error_cause : uint32_t {
  gpu_lib_error = 1,
  setup_error,
  query_error,
  read_error,
  system_error,
  invalid_argument,
  other,
  unknown,
};

struct exception : std::system_error {
  using system_error::system_error;
};

std::error_code make_error_code(errc) noexcept;
std::error_condition make_error_condition(error_cause) noexcept;

const std::error_category &generic_category() noexcept;
const std::error_category &gpu_category() noexcept;
} // namespace pwr
