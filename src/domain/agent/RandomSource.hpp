/**
 * @file RandomSource.hpp
 * @brief Injectable randomness for canned-response selection.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace mindshield::domain::agent {

/**
 * @class RandomSource
 * @brief Abstract interface so tests can script exact phrase selection.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Returns an index in [0, bound). bound is never zero.
     */
    virtual std::size_t pick(std::size_t bound) = 0;
};

/**
 * @class Mt19937RandomSource
 * @brief Default source. Seed 0 draws a seed from std::random_device.
 * Shared between agent sessions, so draws are serialized.
 */
class Mt19937RandomSource : public RandomSource {
public:
    explicit Mt19937RandomSource(std::uint32_t seed = 0)
        : m_engine(seed != 0 ? seed : std::random_device{}()) {}

    std::size_t pick(std::size_t bound) override {
        std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
        std::lock_guard<std::mutex> lock(m_mutex);
        return dist(m_engine);
    }

private:
    std::mt19937 m_engine;
    std::mutex m_mutex;
};

} // namespace mindshield::domain::agent
