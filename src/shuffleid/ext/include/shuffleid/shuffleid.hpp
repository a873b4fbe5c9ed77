/**
 * ShuffleID — Reversible integer shuffling
 *
 * Main header that includes all ShuffleID components and provides
 * convenience classes.
 *
 * Usage:
 *   #include <shuffleid/shuffleid.hpp>
 *
 *   auto cipher = shuffleid::ShuffleCipher::from_seed(32, secret);
 *   uint64_t public_id = cipher.encode(row_id);
 *   uint64_t row = cipher.decode(public_id);
 */

#ifndef SHUFFLEID_SHUFFLEID_HPP
#define SHUFFLEID_SHUFFLEID_HPP

// Version
#define SHUFFLEID_VERSION_MAJOR 0
#define SHUFFLEID_VERSION_MINOR 1
#define SHUFFLEID_VERSION_PATCH 0
#define SHUFFLEID_VERSION_STRING "0.1.0"

// Core components
#include <shuffleid/errors.hpp>
#include <shuffleid/splitmix64.hpp>
#include <shuffleid/key_schedule.hpp>
#include <shuffleid/shuffle_cipher.hpp>

#include <string>
#include <utility>
#include <vector>

namespace shuffleid {

// ============================================================================
// ShuffledSequence — The whole domain in shuffled order
// ============================================================================

/**
 * Read-only view of [0, 2^bit_size) in cipher order.
 *
 * Position i holds encode(i); position_of() answers the reverse question.
 * Nothing is stored besides the cipher, so the view is O(1) memory.
 */
class ShuffledSequence {
private:
    ShuffleCipher cipher_;

public:
    /**
     * @throws ConfigurationError if bit_size is 64, whose length does not
     *         fit in a uint64_t
     */
    explicit ShuffledSequence(ShuffleCipher cipher)
        : cipher_(std::move(cipher))
    {
        if (cipher_.bit_size() >= 64) {
            throw ConfigurationError("ShuffledSequence needs bit_size < 64, got "
                                     + std::to_string(cipher_.bit_size()));
        }
    }

    ShuffledSequence(size_t bit_size, uint64_t seed, size_t rounds = DEFAULT_ROUNDS)
        : ShuffledSequence(ShuffleCipher::from_seed(bit_size, seed, rounds)) {}

    uint64_t operator[](uint64_t position) const { return cipher_.encode(position); }
    uint64_t position_of(uint64_t value) const { return cipher_.decode(value); }

    /** Shuffled values for positions [start, start + count) */
    std::vector<uint64_t> materialize(uint64_t start, uint64_t count) const {
        if (count > size() || start > size() - count) {
            throw DomainError("range [" + std::to_string(start) + ", "
                              + std::to_string(start) + " + "
                              + std::to_string(count) + ") exceeds "
                              + std::to_string(size()) + " values");
        }
        std::vector<uint64_t> values(count);
        for (uint64_t i = 0; i < count; ++i)
            values[i] = cipher_.encode(start + i);
        return values;
    }

    // Accessors
    uint64_t size() const noexcept { return cipher_.max_value() + 1; }
    const ShuffleCipher& cipher() const noexcept { return cipher_; }
};

} // namespace shuffleid

#endif // SHUFFLEID_SHUFFLEID_HPP
