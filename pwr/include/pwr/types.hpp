// types.hpp

#pragma once

#include <pwr/error.hpp>

#include <nonstd/expected.hpp>

#include <vector>

namespace pwr {
template <typename R> using result = nonstd::expected<R, std::error_code>;

// one value per column, as returned by a single read
using readings = std::vector<double>;

// one-dimensional series, one value per point in time
using series = std::vector<double>;

// two-dimensional series, rows are points in time
using matrix = std::vector<readings>;
} // namespace pwr
