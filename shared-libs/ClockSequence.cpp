#include "ClockSequence.hpp"

namespace unik {
    std::uint16_t ClockSequence::randomSeed(EntropySource& entropy) {
        std::uint8_t seed[2];
        entropy.fill(seed, sizeof(seed));
        return static_cast<std::uint16_t>((seed[0] << 8) | seed[1]);
    }

    ClockSequence::ClockSequence(EntropySource& entropy) : mCounter(randomSeed(entropy)) {}

    ClockSequence::ClockSequence(std::uint16_t seed) : mCounter(seed) {}

    std::uint16_t ClockSequence::next() {
        return static_cast<std::uint16_t>(mCounter.fetch_add(1, std::memory_order_relaxed) & MASK);
    }

    void ClockSequence::reseed(std::uint16_t seed) {
        mCounter.store(seed);
    }
}
