#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fxg {

struct CacheOptions {
    std::string name = "cache";
    std::size_t capacity = 20;
    std::chrono::milliseconds ttl{5 * 60 * 1000};
    /// Background expiry sweep period; zero disables the sweep.
    std::chrono::milliseconds sweepInterval{60 * 1000};
};

struct CacheStatistics {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    std::size_t size = 0;
    std::size_t capacity = 0;

    /// Hit rate in percent, 0 when nothing was looked up.
    double hitRate() const noexcept {
        const auto total = hits + misses;
        return total == 0U ? 0.0 : (static_cast<double>(hits) * 100.0) / static_cast<double>(total);
    }
};

} // namespace fxg
