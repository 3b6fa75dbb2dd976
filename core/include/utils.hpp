#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace core {
namespace utils {

    // Position sizes are fractions internally and percentages at the edges
    double percentToFraction(double percent);
    double fractionToPercent(double fraction);

    // "1.5%", "40%" - percentage label for a fractional position size
    std::string formatSizeLabel(double fraction);

    // Upper bound on the number of values percentRange() will produce
    constexpr std::size_t kMaxRangeValues = 10000;

    // Inclusive arithmetic range of percentages, e.g. (1, 40, 0.5) -> 1, 1.5, ..., 40.
    // Each value is computed from its index so steps don't accumulate rounding error.
    // Throws std::invalid_argument for a non-positive step or more than kMaxRangeValues values.
    std::vector<double> percentRange(double start, double stop, double step);

    // ISO 8601 UTC string, e.g. 2026-01-31T12:00:00Z
    std::string timestampToString(const std::chrono::system_clock::time_point& ts);

} // namespace utils
} // namespace core
