/**
 * StoryRNG — Seeded PRNG for reproducible play-throughs.
 *
 * mulberry32 core. The full generator state is two 32-bit integers, so a
 * snapshot can capture it exactly and a restored session draws the same
 * sequence as an uninterrupted one.
 *
 * Only NPC random-walk movement and spinner messages draw from it; condition
 * evaluation never does.
 */

#ifndef STORY_CORE_STORY_RNG_HPP
#define STORY_CORE_STORY_RNG_HPP

#include <cstddef>
#include <cstdint>

namespace story {

class StoryRNG {
public:
    explicit StoryRNG(int32_t seed = 42)
        : seed_(seed), state_(seed ? seed : 1) {}

    /** Next float in [0, 1). */
    double random() {
        state_ = static_cast<int32_t>(static_cast<uint32_t>(state_) + 0x6D2B79F5u);
        uint32_t t = static_cast<uint32_t>(state_);
        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);
        return static_cast<double>((t ^ (t >> 14))) / 4294967296.0;
    }

    /** Uniform index in [0, n). Returns 0 when n == 0. */
    size_t next_index(size_t n) {
        if (n == 0) return 0;
        size_t idx = static_cast<size_t>(random() * static_cast<double>(n));
        return idx < n ? idx : n - 1;
    }

    int32_t seed() const { return seed_; }
    int32_t state() const { return state_; }

    void reseed(int32_t seed) {
        seed_ = seed;
        state_ = seed ? seed : 1;
    }

    // Snapshot restore: resume mid-sequence.
    void restore(int32_t seed, int32_t state) {
        seed_ = seed;
        state_ = state;
    }

private:
    int32_t seed_;
    int32_t state_;

    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b)
        );
    }
};

} // namespace story

#endif // STORY_CORE_STORY_RNG_HPP
