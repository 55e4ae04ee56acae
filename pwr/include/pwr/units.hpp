// units.hpp

#pragma once

#include <pwr/types.hpp>

#include <cstdint>
#include <iosfwd>
#include <ratio>
#include <string>
#include <string_view>
#include <utility>

namespace pwr {
enum class quantity : uint32_t {
  energy,
  power,
  temperature,
};

const char *to_string(quantity) noexcept;
result<quantity> quantity_from_string(std::string_view);

std::ostream &operator<<(std::ostream &, quantity);

// label and multiplicative factor to the SI base unit
class unit {
private:
  std::string _label;
  double _factor;

public:
  template <typename Ratio> static unit from_ratio(std::string label) {
    return unit(std::move(label),
                static_cast<double>(Ratio::num) / static_cast<double>(Ratio::den));
  }

  unit();
  unit(std::string label, double factor);

  const std::string &label() const noexcept;
  double to_si() const noexcept;

  bool operator==(const unit &) const noexcept;
  bool operator!=(const unit &) const noexcept;
};

std::ostream &operator<<(std::ostream &, const unit &);

namespace units {
unit microjoules();
unit millijoules();
unit joules();
unit milliwatts();
unit watts();
unit celsius();
} // namespace units

// factor for a unit known only by its label, 1 for unknown labels
double conversion_factor(std::string_view label) noexcept;
} // namespace pwr
