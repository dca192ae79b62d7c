/**
 * @file Resources.hpp
 * @brief CPU and memory quantities and the ResourceLimits value
 *
 * Quantities are semantic: a CpuQuantity is a decimal core count and a
 * MemoryQuantity a byte count. Text forms ("0.5", "512M") only appear at
 * the parsing and emitting boundaries.
 */

#ifndef COMPOSER_RESOURCES_HPP
#define COMPOSER_RESOURCES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace composer {

/**
 * @brief Decimal CPU core count (compose `cpus`)
 *
 * Stored in millicores so that equality is exact.
 */
class CpuQuantity {
public:
    CpuQuantity() = default;
    explicit CpuQuantity(std::int64_t millicores) : millicores_(millicores) {}

    static CpuQuantity from_cores(double cores);

    std::int64_t millicores() const noexcept { return millicores_; }
    double cores() const noexcept { return static_cast<double>(millicores_) / 1000.0; }

    /**
     * @brief Shortest decimal form: "2", "0.5", "0.25"
     */
    std::string to_string() const;

    bool operator==(const CpuQuantity& o) const noexcept { return millicores_ == o.millicores_; }
    bool operator!=(const CpuQuantity& o) const noexcept { return !(*this == o); }

private:
    std::int64_t millicores_ = 0;
};

/**
 * @brief Memory size in bytes (compose `memory`)
 */
class MemoryQuantity {
public:
    MemoryQuantity() = default;
    explicit MemoryQuantity(std::uint64_t bytes) : bytes_(bytes) {}

    std::uint64_t bytes() const noexcept { return bytes_; }

    /**
     * @brief Largest binary unit that divides exactly: "1G", "512M", "64K", "100b"
     */
    std::string to_string() const;

    bool operator==(const MemoryQuantity& o) const noexcept { return bytes_ == o.bytes_; }
    bool operator!=(const MemoryQuantity& o) const noexcept { return !(*this == o); }

private:
    std::uint64_t bytes_ = 0;
};

/**
 * @brief deploy.resources limits and reservations
 */
struct ResourceLimits {
    std::optional<CpuQuantity> cpu_limit;
    std::optional<MemoryQuantity> memory_limit;
    std::optional<CpuQuantity> cpu_reservation;
    std::optional<MemoryQuantity> memory_reservation;

    bool has_limits() const noexcept { return cpu_limit || memory_limit; }
    bool has_reservations() const noexcept { return cpu_reservation || memory_reservation; }
    bool empty() const noexcept { return !has_limits() && !has_reservations(); }

    bool operator==(const ResourceLimits& o) const {
        return cpu_limit == o.cpu_limit && memory_limit == o.memory_limit &&
               cpu_reservation == o.cpu_reservation &&
               memory_reservation == o.memory_reservation;
    }
    bool operator!=(const ResourceLimits& o) const { return !(*this == o); }
};

} // namespace composer

#endif // COMPOSER_RESOURCES_HPP
