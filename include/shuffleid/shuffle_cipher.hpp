/**
 * ShuffleID — Reversible integer shuffling
 *
 * Shuffle Cipher
 *
 * A keyed permutation of [0, 2^bit_size) built from additive mixing
 * rounds over the two halves of the value.
 *
 * Properties:
 * - Bijective: every input maps to exactly one unique output
 * - Invertible: decode(encode(v)) == v
 * - Immutable: round tables are fixed at construction, so a cipher can be
 *   shared between threads without locking
 */

#ifndef SHUFFLEID_SHUFFLE_CIPHER_HPP
#define SHUFFLEID_SHUFFLE_CIPHER_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include "errors.hpp"
#include "key_schedule.hpp"

namespace shuffleid {

/**
 * Shuffle Cipher
 *
 * The value is split into x (low half) and y (high half). Each round adds
 * a table entry selected by y to x, then an entry selected by the new x to
 * y, both modulo 2^half_bits. Decode subtracts in the opposite order with
 * the rounds reversed.
 */
class ShuffleCipher {
private:
    size_t bit_size_;       // Width of the domain
    unsigned half_bits_;    // Bits in x and in y
    uint64_t half_mask_;    // max_shuffle - 1
    uint64_t max_value_;    // 2^bit_size - 1
    Schedule tables_;       // Round tables, application order

    void check_domain(uint64_t value) const {
        if (value > max_value_) {
            throw DomainError("value " + std::to_string(value)
                              + " outside [0, 2^" + std::to_string(bit_size_)
                              + ")");
        }
    }

public:
    /**
     * Construct from explicit round tables
     *
     * @param bit_size Width of the integer domain (even, 2..64)
     * @param tables Round tables, each 2 * 2^(bit_size / 2) entries below
     *               2^(bit_size / 2)
     * @throws ConfigurationError if bit_size or any table is invalid
     */
    ShuffleCipher(size_t bit_size, Schedule tables)
        : bit_size_(bit_size)
        , half_bits_(static_cast<unsigned>(bit_size / 2))
        , half_mask_(0)
        , max_value_(0)
        , tables_(std::move(tables))
    {
        validate_schedule(bit_size_, tables_);
        half_mask_ = (uint64_t{1} << half_bits_) - 1;
        max_value_ = bit_size_ == 64 ? ~uint64_t{0}
                                     : (uint64_t{1} << bit_size_) - 1;
    }

    /**
     * Construct from a seed (the secret)
     *
     * @param bit_size Width of the integer domain (even, 2..64)
     * @param seed The secret key
     * @param rounds Number of mixing rounds (default 5)
     */
    static ShuffleCipher from_seed(size_t bit_size, uint64_t seed,
                                   size_t rounds = DEFAULT_ROUNDS) {
        return ShuffleCipher(bit_size, generate_schedule(bit_size, seed, rounds));
    }

    /**
     * Shuffle a value
     *
     * @param value Input in [0, 2^bit_size)
     * @return Shuffled value in [0, 2^bit_size)
     * @throws DomainError if value is out of range
     */
    uint64_t encode(uint64_t value) const {
        check_domain(value);

        uint64_t x = value & half_mask_;
        uint64_t y = (value >> half_bits_) & half_mask_;

        for (const RoundTable& table : tables_) {
            x = (x + table[y]) & half_mask_;
            y = (y + table[x + half_bits_]) & half_mask_;
        }

        return (y << half_bits_) | x;
    }

    /**
     * Inverse of encode
     *
     * decode(encode(v)) == v for all v in [0, 2^bit_size)
     *
     * @param value Shuffled value in [0, 2^bit_size)
     * @return Original value
     * @throws DomainError if value is out of range
     */
    uint64_t decode(uint64_t value) const {
        check_domain(value);

        uint64_t x = value & half_mask_;
        uint64_t y = (value >> half_bits_) & half_mask_;

        // Undo the rounds in REVERSE order, y before x
        for (auto it = tables_.rbegin(); it != tables_.rend(); ++it) {
            const RoundTable& table = *it;
            y = (y - table[x + half_bits_]) & half_mask_;
            x = (x - table[y]) & half_mask_;
        }

        return (y << half_bits_) | x;
    }

    bool operator==(const ShuffleCipher& other) const {
        return bit_size_ == other.bit_size_ && tables_ == other.tables_;
    }
    bool operator!=(const ShuffleCipher& other) const { return !(*this == other); }

    // Accessors
    size_t bit_size() const noexcept { return bit_size_; }
    unsigned half_bits() const noexcept { return half_bits_; }
    uint64_t max_shuffle() const noexcept { return half_mask_ + 1; }
    uint64_t max_value() const noexcept { return max_value_; }
    size_t rounds() const noexcept { return tables_.size(); }
    const Schedule& round_tables() const noexcept { return tables_; }
};

} // namespace shuffleid

#endif // SHUFFLEID_SHUFFLE_CIPHER_HPP
