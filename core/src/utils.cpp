#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip>    // For std::put_time
#include <sstream>
#include <string>
#include <stdexcept>  // For std::invalid_argument
#include <cmath>      // For std::round, std::floor

namespace core {
namespace utils {

    double percentToFraction(double percent) {
        return percent / 100.0;
    }

    double fractionToPercent(double fraction) {
        // Round away representation noise (0.015 * 100 = 1.4999999999999998)
        return std::round(fraction * 100.0 * 1e9) / 1e9;
    }

    std::string formatSizeLabel(double fraction) {
        return fmt::format("{}%", fractionToPercent(fraction));
    }

    std::vector<double> percentRange(double start, double stop, double step) {
        if (!(step > 0.0) || !std::isfinite(start) || !std::isfinite(stop)) {
            throw std::invalid_argument("Range bounds must be finite and step positive.");
        }
        if (stop < start) {
            throw std::invalid_argument("Range stop must not be below start.");
        }
        // Tolerate stop landing a hair below an exact multiple of step
        const double steps = std::floor((stop - start) / step + 1e-9);
        if (!std::isfinite(steps) || steps + 1.0 > static_cast<double>(kMaxRangeValues)) {
            throw std::invalid_argument(fmt::format("Range would produce more than {} values.", kMaxRangeValues));
        }
        const auto count = static_cast<std::size_t>(steps) + 1;
        std::vector<double> values;
        values.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            values.push_back(start + static_cast<double>(i) * step);
        }
        return values;
    }

    std::string timestampToString(const std::chrono::system_clock::time_point& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

} // namespace utils
} // namespace core
