#include "fxgate/scheduling/random_source.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace fxg {

#if defined(__linux__)
SecureRandomSource::SecureRandomSource() : device_("/dev/urandom") {}
#else
SecureRandomSource::SecureRandomSource() = default;
#endif

double SecureRandomSource::nextUnit() {
    std::lock_guard<std::mutex> lock(mutex_);
    // 53 random bits fill the double mantissa exactly; result is in [0, 1).
    const auto hi = static_cast<std::uint64_t>(device_()) >> 5U;
    const auto lo = static_cast<std::uint64_t>(device_()) >> 6U;
    return static_cast<double>((hi << 26U) | lo) / 9007199254740992.0;
}

ScriptedRandomSource::ScriptedRandomSource(std::vector<double> values) { setValues(std::move(values)); }

double ScriptedRandomSource::nextUnit() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto value = values_[next_];
    next_ = (next_ + 1U) % values_.size();
    ++draws_;
    return value;
}

void ScriptedRandomSource::setValues(std::vector<double> values) {
    if (values.empty()) {
        throw std::invalid_argument("ScriptedRandomSource requires at least one value");
    }
    for (auto& v : values) {
        v = std::clamp(v, 0.0, 0.9999999999999999);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    values_ = std::move(values);
    next_ = 0;
}

std::size_t ScriptedRandomSource::draws() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return draws_;
}

} // namespace fxg
