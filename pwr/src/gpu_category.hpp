#pragma once

#include <system_error>

namespace pwr {
struct gpu_category_t : std::error_category {
  const char *name() const noexcept override;
  std::string message(int) const override;
  std::error_condition default_error_condition(int) const noexcept override;
};
} // namespace pwr
