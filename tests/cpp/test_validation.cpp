/**
 * ShuffleID C++ Tests — Configuration and Domain Validation
 *
 * Tests that invalid bit sizes, round counts and tables are rejected with
 * ConfigurationError, and out-of-range values with DomainError.
 */

#include <shuffleid/shuffleid.hpp>
#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>

template<typename E, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_bit_size_rejected() {
    using shuffleid::ConfigurationError;
    using shuffleid::ShuffleCipher;

    size_t invalid[] = {0, 1, 3, 7, 15, 66, 128};
    for (size_t bits : invalid) {
        assert(throws<ConfigurationError>([&] { ShuffleCipher::from_seed(bits, 42); })
               && "Invalid bit_size accepted");
        assert(throws<ConfigurationError>([&] { shuffleid::generate_schedule(bits, 42); }));
    }
}

void test_rounds_rejected() {
    assert(throws<shuffleid::ConfigurationError>(
        [] { shuffleid::ShuffleCipher::from_seed(8, 42, 0); }) && "Zero rounds accepted");
    assert(throws<shuffleid::ConfigurationError>(
        [] { shuffleid::generate_schedule(8, 42, 0); }));
}

void test_explicit_tables_rejected() {
    using shuffleid::ConfigurationError;
    using shuffleid::Schedule;
    using shuffleid::ShuffleCipher;

    // No rounds
    assert(throws<ConfigurationError>([] { ShuffleCipher(4, Schedule{}); }));

    // 4 bits needs tables of 8 entries below 4
    Schedule short_table = {{0, 1, 2, 3, 0, 1, 2}};
    assert(throws<ConfigurationError>([&] { ShuffleCipher(4, short_table); }));

    Schedule long_table = {{0, 1, 2, 3, 0, 1, 2, 3, 0}};
    assert(throws<ConfigurationError>([&] { ShuffleCipher(4, long_table); }));

    Schedule out_of_range = {{0, 1, 2, 3, 0, 1, 2, 3}, {0, 1, 2, 3, 0, 1, 2, 4}};
    assert(throws<ConfigurationError>([&] { ShuffleCipher(4, out_of_range); }));

    // Odd width with otherwise plausible tables
    assert(throws<ConfigurationError>([] { ShuffleCipher(3, {{0, 1, 0, 1}}); }));

    Schedule valid = {{0, 1, 2, 3, 0, 1, 2, 3}};
    ShuffleCipher cipher(4, valid);
    assert(cipher.rounds() == 1);
    assert(cipher.max_shuffle() == 4);
}

void test_configuration_error_type() {
    try {
        shuffleid::ShuffleCipher::from_seed(5, 1);
        assert(false && "Expected ConfigurationError");
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()).find("bit_size") != std::string::npos);
    }
}

void test_domain_rejected(size_t bit_size) {
    auto cipher = shuffleid::ShuffleCipher::from_seed(bit_size, 42);
    const uint64_t n = uint64_t{1} << bit_size;

    uint64_t outside[] = {n, n + 1, n * 2, ~uint64_t{0}};
    for (uint64_t v : outside) {
        assert(throws<shuffleid::DomainError>([&] { cipher.encode(v); })
               && "Out-of-range encode accepted");
        assert(throws<shuffleid::DomainError>([&] { cipher.decode(v); })
               && "Out-of-range decode accepted");
        assert(throws<std::out_of_range>([&] { cipher.encode(v); }));
    }

    // Boundaries are inside
    assert(cipher.decode(cipher.encode(n - 1)) == n - 1);
    assert(cipher.decode(cipher.encode(0)) == 0);
}

void test_full_width_domain() {
    // A 64-bit schedule holds 2^33 entries per round, too large to build here
    assert(!throws<shuffleid::ConfigurationError>([] { shuffleid::validate_bit_size(64); }));
    assert(throws<shuffleid::ConfigurationError>([] { shuffleid::validate_bit_size(65); }));
}

void test_sequence_rejected() {
    shuffleid::ShuffledSequence seq(4, 9);
    assert(throws<shuffleid::DomainError>([&] { seq[16]; }));
    assert(throws<shuffleid::DomainError>([&] { seq.position_of(16); }));
    assert(throws<shuffleid::DomainError>([&] { seq.materialize(10, 7); }));
    assert(throws<shuffleid::DomainError>([&] { seq.materialize(17, 0); }));
    assert(seq.materialize(16, 0).empty());
}

void test_hand_computed_cipher() {
    // 2 bits: x and y are single bits, tables hold 4 entries below 2
    shuffleid::ShuffleCipher one_round(2, {{1, 0, 0, 1}});
    uint64_t expected_one[] = {1, 0, 2, 3};
    for (uint64_t v = 0; v < 4; ++v) {
        assert(one_round.encode(v) == expected_one[v]);
        assert(one_round.decode(expected_one[v]) == v);
    }

    shuffleid::ShuffleCipher two_rounds(2, {{1, 0, 0, 1}, {0, 1, 1, 1}});
    uint64_t expected_two[] = {3, 2, 1, 0};
    for (uint64_t v = 0; v < 4; ++v) {
        assert(two_rounds.encode(v) == expected_two[v]);
        assert(two_rounds.decode(expected_two[v]) == v);
    }

    // All-zero tables leave every value in place
    shuffleid::ShuffleCipher identity(4, {{0, 0, 0, 0, 0, 0, 0, 0}});
    for (uint64_t v = 0; v < 16; ++v)
        assert(identity.encode(v) == v);
}

int main() {
    printf("Testing configuration validation...\n");
    test_bit_size_rejected();
    test_rounds_rejected();
    test_explicit_tables_rejected();
    test_configuration_error_type();
    test_full_width_domain();
    printf("  PASS\n");

    printf("\nTesting domain validation...\n");
    for (size_t bits : {2, 8, 16, 32}) {
        test_domain_rejected(bits);
        printf("  bit_size=%zu: PASS\n", bits);
    }
    test_sequence_rejected();
    printf("  ShuffledSequence: PASS\n");

    printf("\nTesting hand-computed ciphers...\n");
    test_hand_computed_cipher();
    printf("  PASS\n");

    printf("\nAll C++ tests passed!\n");
    return 0;
}
