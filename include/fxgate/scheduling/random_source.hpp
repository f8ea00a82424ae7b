#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <vector>

namespace fxg {

/**
 * @brief Source of uniformly distributed values in [0, 1).
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    virtual double nextUnit() = 0;
};

/**
 * @brief Draws from the operating system entropy device.
 *
 * Selection outcomes must not be predictable from earlier outcomes, so no
 * seeded PRNG sits in between.
 */
class SecureRandomSource final : public IRandomSource {
public:
    SecureRandomSource();

    double nextUnit() override;

private:
    std::mutex mutex_;
    std::random_device device_;
};

/**
 * @brief Replays a fixed sequence of draws, cycling when exhausted.
 */
class ScriptedRandomSource final : public IRandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> values);

    double nextUnit() override;
    void setValues(std::vector<double> values);
    std::size_t draws() const;

private:
    mutable std::mutex mutex_;
    std::vector<double> values_;
    std::size_t next_ = 0;
    std::size_t draws_ = 0;
};

} // namespace fxg
