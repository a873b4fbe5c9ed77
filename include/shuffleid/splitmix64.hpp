/**
 * ShuffleID — Reversible integer shuffling
 *
 * SplitMix64 PRNG Implementation
 *
 * A fast 64-bit pseudo-random number generator.
 * Reference: Steele, Lea, Flood (2014) "Fast splittable pseudorandom number generators"
 *
 * The exact output sequence is part of the key schedule format: tables
 * generated from a seed are only reproducible as long as this generator
 * and its consumption order stay fixed.
 *
 * Properties:
 * - Period: 2^64
 * - State: 64 bits (8 bytes)
 * - Output: 64 bits
 */

#ifndef SHUFFLEID_SPLITMIX64_HPP
#define SHUFFLEID_SPLITMIX64_HPP

#include <cstdint>

namespace shuffleid {

/**
 * SplitMix64 PRNG class
 *
 * Drives round table generation. Every call to next() or next_bits()
 * advances the state exactly once.
 */
class SplitMix64 {
private:
    uint64_t state_;

public:
    /**
     * Construct with initial seed
     * @param seed Initial state value
     */
    explicit constexpr SplitMix64(uint64_t seed) noexcept : state_(seed) {}

    /**
     * Generate next random value (advances state)
     * @return 64-bit pseudo-random value
     */
    constexpr uint64_t next() noexcept {
        uint64_t z = (state_ += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    /**
     * Uniform value in [0, 2^bits), taken from the high bits of next()
     *
     * @param bits Width of the result, 1..64
     * @return Value below 2^bits
     */
    constexpr uint64_t next_bits(unsigned bits) noexcept {
        return next() >> (64 - bits);
    }

    /** Current generator state */
    constexpr uint64_t state() const noexcept { return state_; }
};

} // namespace shuffleid

#endif // SHUFFLEID_SPLITMIX64_HPP
