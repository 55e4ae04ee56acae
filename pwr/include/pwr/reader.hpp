// reader.hpp

#pragma once

#include <pwr/types.hpp>
#include <pwr/units.hpp>

#include <string>
#include <utility>
#include <vector>

namespace pwr {
// what a reader does when asked for a quantity it cannot provide
enum class quantity_policy {
  fail_fast,
  log_and_skip,
};

const char *to_string(quantity_policy) noexcept;

class reader {
public:
  using unit_table = std::vector<std::pair<quantity, unit>>;

private:
  unit_table _units;
  std::vector<quantity> _quantities;
  quantity_policy _policy;

protected:
  // throws exception(errc::unsupported_quantity) under fail_fast
  reader(unit_table supported, const std::vector<quantity> &requested,
         quantity_policy policy);

public:
  virtual ~reader() = default;

  reader(const reader &) = delete;
  reader &operator=(const reader &) = delete;

  // one tag per device or domain, fixed for the lifetime of the reader
  virtual std::vector<std::string> tags() const = 0;

  // one value per quantity per tag, quantity-major
  virtual readings read() = 0;

  // lowercase name used for default output file names
  virtual std::string name() const = 0;

  virtual unit get_unit(quantity) const;

  virtual matrix compute_energy_delta(const matrix &) const;

  bool supports(quantity) const noexcept;
  const std::vector<quantity> &quantities() const noexcept;
  quantity_policy policy() const noexcept;
  bool energy_without_power() const noexcept;

  series compute_energy_delta(const series &) const;

  matrix compute_power_series(const series &time_s, const matrix &energy) const;
  series compute_power_series(const series &time_s, const series &energy) const;
};
} // namespace pwr
