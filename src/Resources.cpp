/**
 * @file Resources.cpp
 * @brief Quantity formatting
 */

#include "composer/Resources.hpp"

#include <cmath>

namespace composer {

CpuQuantity CpuQuantity::from_cores(double cores) {
    return CpuQuantity(static_cast<std::int64_t>(std::llround(cores * 1000.0)));
}

std::string CpuQuantity::to_string() const {
    std::int64_t whole = millicores_ / 1000;
    std::int64_t frac = millicores_ % 1000;
    std::string out = std::to_string(whole);
    if (frac == 0) {
        return out;
    }
    std::string digits = std::to_string(frac);
    digits.insert(0, 3 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return out + "." + digits;
}

std::string MemoryQuantity::to_string() const {
    constexpr std::uint64_t kKiB = 1024;
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;

    if (bytes_ != 0) {
        if (bytes_ % kGiB == 0) return std::to_string(bytes_ / kGiB) + "G";
        if (bytes_ % kMiB == 0) return std::to_string(bytes_ / kMiB) + "M";
        if (bytes_ % kKiB == 0) return std::to_string(bytes_ / kKiB) + "K";
    }
    return std::to_string(bytes_) + "b";
}

} // namespace composer
