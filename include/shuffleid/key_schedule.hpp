/**
 * ShuffleID — Reversible integer shuffling
 *
 * Key Schedule Generation
 *
 * Derives the ordered round tables of a shuffle cipher from a seed.
 *
 * Layout of one round table for a given bit size:
 * - half_bits   = bit_size / 2
 * - max_shuffle = 2^half_bits
 * - length      = 2 * max_shuffle entries, each in [0, max_shuffle)
 *
 * Entries are drawn from SplitMix64(seed), round 0 first, position 0
 * first, one generator step per entry. Two calls with the same
 * (bit_size, seed, rounds) return identical schedules.
 */

#ifndef SHUFFLEID_KEY_SCHEDULE_HPP
#define SHUFFLEID_KEY_SCHEDULE_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "errors.hpp"
#include "splitmix64.hpp"

namespace shuffleid {

using RoundTable = std::vector<uint64_t>;
using Schedule = std::vector<RoundTable>;

constexpr size_t DEFAULT_ROUNDS = 5;
constexpr size_t MAX_BIT_SIZE = 64;

/** Throws ConfigurationError unless bit_size is even and within [2, 64] */
inline void validate_bit_size(size_t bit_size) {
    if (bit_size < 2 || bit_size % 2 != 0) {
        throw ConfigurationError("bit_size must be an even number >= 2, got "
                                 + std::to_string(bit_size));
    }
    if (bit_size > MAX_BIT_SIZE) {
        throw ConfigurationError("bit_size must not exceed "
                                 + std::to_string(MAX_BIT_SIZE) + ", got "
                                 + std::to_string(bit_size));
    }
}

/** Number of entries in one round table, 2 * 2^(bit_size / 2) */
inline size_t table_length(size_t bit_size) noexcept {
    return size_t{2} << (bit_size / 2);
}

/**
 * Check an externally supplied schedule against a bit size
 *
 * @throws ConfigurationError on an invalid bit size, an empty schedule,
 *         a table of the wrong length or an entry >= 2^(bit_size / 2)
 */
inline void validate_schedule(size_t bit_size, const Schedule& tables) {
    validate_bit_size(bit_size);
    if (tables.empty()) {
        throw ConfigurationError("schedule must contain at least one round");
    }

    const size_t expected = table_length(bit_size);
    const uint64_t max_shuffle = uint64_t{1} << (bit_size / 2);

    for (size_t r = 0; r < tables.size(); ++r) {
        const RoundTable& table = tables[r];
        if (table.size() != expected) {
            throw ConfigurationError("round " + std::to_string(r) + " has "
                                     + std::to_string(table.size())
                                     + " entries, expected "
                                     + std::to_string(expected));
        }
        for (size_t i = 0; i < table.size(); ++i) {
            if (table[i] >= max_shuffle) {
                throw ConfigurationError("round " + std::to_string(r)
                                         + " entry " + std::to_string(i)
                                         + " is " + std::to_string(table[i])
                                         + ", must be below "
                                         + std::to_string(max_shuffle));
            }
        }
    }
}

/**
 * Generate the round tables for a seed
 *
 * @param bit_size Width of the integer domain (even, 2..64)
 * @param seed The secret key
 * @param rounds Number of rounds (>= 1)
 * @return rounds tables of table_length(bit_size) entries each
 * @throws ConfigurationError on an invalid bit size or zero rounds
 */
inline Schedule generate_schedule(size_t bit_size, uint64_t seed,
                                  size_t rounds = DEFAULT_ROUNDS) {
    validate_bit_size(bit_size);
    if (rounds < 1) {
        throw ConfigurationError("rounds must be >= 1");
    }

    const unsigned half_bits = static_cast<unsigned>(bit_size / 2);
    const size_t length = table_length(bit_size);

    SplitMix64 rng(seed);
    Schedule tables(rounds);
    for (RoundTable& table : tables) {
        table.resize(length);
        for (size_t i = 0; i < length; ++i)
            table[i] = rng.next_bits(half_bits);
    }
    return tables;
}

} // namespace shuffleid

#endif // SHUFFLEID_KEY_SCHEDULE_HPP
