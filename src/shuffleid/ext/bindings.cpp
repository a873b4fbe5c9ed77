/**
 * ShuffleID Python Bindings (pybind11)
 *
 * Exposes the C++ core as `_shuffleid_native`.
 *
 * Build:
 *   pip install pybind11
 *   mkdir build && cd build
 *   cmake .. -DSHUFFLEID_BUILD_PYTHON=ON
 *   cmake --build .
 */

// MinGW workaround: include these before pybind11
#include <mutex>
#include <cstring>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/operators.h>
#include <shuffleid/shuffleid.hpp>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Python ints are unbounded and signed; reject anything the domain does
 * not contain before it reaches the uint64_t API
 */
static uint64_t domain_value(const shuffleid::ShuffleCipher& cipher, const py::int_& value) {
    if (value < py::int_(0) || value > py::int_(cipher.max_value())) {
        throw shuffleid::DomainError("value " + std::string(py::str(value))
                                     + " outside [0, 2^"
                                     + std::to_string(cipher.bit_size()) + ")");
    }
    return value.cast<uint64_t>();
}

static size_t config_size(int64_t value, const char* name) {
    if (value < 0) {
        throw shuffleid::ConfigurationError(std::string(name) + " must not be negative, got "
                                            + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

/** Any Python int is a valid seed; it is reduced modulo 2^64 */
static uint64_t seed_value(const py::int_& seed) {
    py::int_ reduced = seed.attr("__and__")(py::int_(~uint64_t{0}));
    return reduced.cast<uint64_t>();
}

static shuffleid::Schedule to_schedule(const std::vector<std::vector<int64_t>>& tables) {
    shuffleid::Schedule schedule;
    schedule.reserve(tables.size());
    for (size_t r = 0; r < tables.size(); ++r) {
        shuffleid::RoundTable table;
        table.reserve(tables[r].size());
        for (size_t i = 0; i < tables[r].size(); ++i) {
            if (tables[r][i] < 0) {
                throw shuffleid::ConfigurationError("round " + std::to_string(r) + " entry "
                                                    + std::to_string(i) + " is negative");
            }
            table.push_back(static_cast<uint64_t>(tables[r][i]));
        }
        schedule.push_back(std::move(table));
    }
    return schedule;
}

/**
 * Check that [start, start + count) lies inside the domain
 *
 * Negative or oversized Python ints raise DomainError instead of failing
 * the uint64_t cast.
 */
static std::pair<uint64_t, size_t> domain_range(
    const shuffleid::ShuffleCipher& cipher,
    const py::int_& start,
    const py::int_& count
) {
    if (count < py::int_(0)) {
        throw shuffleid::DomainError("count " + std::string(py::str(count))
                                     + " must not be negative");
    }
    uint64_t first = domain_value(cipher, start);
    if (count.equal(py::int_(0))) {
        return {first, 0};
    }
    py::int_ last = start.attr("__add__")(count).attr("__sub__")(py::int_(1));
    domain_value(cipher, last);
    return {first, count.cast<size_t>()};
}

/**
 * Encode a run of consecutive values as numpy array
 */
py::array_t<uint64_t> encode_many(
    const shuffleid::ShuffleCipher& cipher,
    const py::int_& start,
    const py::int_& count
) {
    auto range = domain_range(cipher, start, count);

    py::array_t<uint64_t> result(range.second);
    auto buf = result.mutable_unchecked<1>();

    for (size_t i = 0; i < range.second; ++i) {
        buf(i) = cipher.encode(range.first + i);
    }

    return result;
}

/**
 * Decode an array of shuffled values
 */
py::array_t<uint64_t> decode_many(
    const shuffleid::ShuffleCipher& cipher,
    py::array_t<uint64_t, py::array::c_style | py::array::forcecast> values
) {
    auto in = values.unchecked<1>();
    py::array_t<uint64_t> result(in.shape(0));
    auto out = result.mutable_unchecked<1>();

    for (py::ssize_t i = 0; i < in.shape(0); ++i) {
        out(i) = cipher.decode(in(i));
    }

    return result;
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(_shuffleid_native, m) {
    m.doc() = R"doc(
ShuffleID (Native C++ Extension)

Keyed, reversible shuffling of fixed-width unsigned integers.
)doc";

    // Version info
    m.attr("__version__") = SHUFFLEID_VERSION_STRING;
    m.attr("DEFAULT_ROUNDS") = shuffleid::DEFAULT_ROUNDS;

    // ========================================================================
    // Errors
    // ========================================================================
    py::register_exception<shuffleid::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<shuffleid::DomainError>(m, "DomainError", PyExc_IndexError);

    // ========================================================================
    // Utility Functions
    // ========================================================================
    m.def("generate_schedule",
        [](int64_t bit_size, const py::int_& seed, int64_t rounds) {
            return shuffleid::generate_schedule(config_size(bit_size, "bit_size"),
                                                seed_value(seed),
                                                config_size(rounds, "rounds"));
        },
        py::arg("bit_size"),
        py::arg("seed"),
        py::arg("rounds") = shuffleid::DEFAULT_ROUNDS,
        "Generate the round tables for a seed as a list of lists");

    m.def("encode_many", &encode_many,
        py::arg("cipher"),
        py::arg("start"),
        py::arg("count"),
        "Encode count consecutive values from start as numpy array");

    m.def("decode_many", &decode_many,
        py::arg("cipher"),
        py::arg("values"),
        "Decode an array of shuffled values as numpy array");

    // ========================================================================
    // SplitMix64 — Core PRNG
    // ========================================================================
    py::class_<shuffleid::SplitMix64>(m, "SplitMix64",
        "Fast PRNG based on SplitMix64 algorithm")
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("next", &shuffleid::SplitMix64::next, "Generate next random number")
        .def("next_bits",
            [](shuffleid::SplitMix64& self, unsigned bits) {
                if (bits < 1 || bits > 64) {
                    throw shuffleid::ConfigurationError("bits must be within [1, 64], got "
                                                        + std::to_string(bits));
                }
                return self.next_bits(bits);
            },
            py::arg("bits"),
            "Generate next random number below 2**bits");

    // ========================================================================
    // ShuffleCipher — Core permutation
    // ========================================================================
    py::class_<shuffleid::ShuffleCipher>(m, "ShuffleCipher",
        R"doc(
Keyed bijection over [0, 2**bit_size).

Args:
    bit_size: Width of the integer domain (even, 2..64)
    round_tables: List of rounds, each 2 * 2**(bit_size // 2) ints
                  below 2**(bit_size // 2)
)doc")
        .def(py::init([](int64_t bit_size, const std::vector<std::vector<int64_t>>& tables) {
                return shuffleid::ShuffleCipher(config_size(bit_size, "bit_size"),
                                                to_schedule(tables));
            }),
            py::arg("bit_size"),
            py::arg("round_tables"))
        .def_static("from_seed",
            [](int64_t bit_size, const py::int_& seed, int64_t rounds) {
                return shuffleid::ShuffleCipher::from_seed(config_size(bit_size, "bit_size"),
                                                           seed_value(seed),
                                                           config_size(rounds, "rounds"));
            },
            py::arg("bit_size"),
            py::arg("seed"),
            py::arg("rounds") = shuffleid::DEFAULT_ROUNDS)
        .def("encode",
            [](const shuffleid::ShuffleCipher& self, const py::int_& value) {
                return self.encode(domain_value(self, value));
            },
            py::arg("value"))
        .def("decode",
            [](const shuffleid::ShuffleCipher& self, const py::int_& value) {
                return self.decode(domain_value(self, value));
            },
            py::arg("value"))
        .def_property_readonly("bit_size", &shuffleid::ShuffleCipher::bit_size)
        .def_property_readonly("rounds", &shuffleid::ShuffleCipher::rounds)
        .def_property_readonly("max_shuffle", &shuffleid::ShuffleCipher::max_shuffle)
        .def_property_readonly("round_tables", &shuffleid::ShuffleCipher::round_tables)
        .def(py::self == py::self)
        .def(py::self != py::self);

    // ========================================================================
    // ShuffledSequence
    // ========================================================================
    py::class_<shuffleid::ShuffledSequence>(m, "ShuffledSequence",
        R"doc(
The domain [0, 2**bit_size) in shuffled order, without storing it.

Args:
    bit_size: Width of the integer domain (even, 2..62)
    seed: The secret key
    rounds: Mixing rounds (default 5)
)doc")
        .def(py::init([](int64_t bit_size, const py::int_& seed, int64_t rounds) {
                return shuffleid::ShuffledSequence(config_size(bit_size, "bit_size"),
                                                   seed_value(seed),
                                                   config_size(rounds, "rounds"));
            }),
            py::arg("bit_size"),
            py::arg("seed"),
            py::arg("rounds") = shuffleid::DEFAULT_ROUNDS)
        .def(py::init<shuffleid::ShuffleCipher>(), py::arg("cipher"))
        .def("__len__", &shuffleid::ShuffledSequence::size)
        .def("__getitem__",
            [](const shuffleid::ShuffledSequence& self, const py::int_& position) {
                return self[domain_value(self.cipher(), position)];
            },
            py::arg("position"))
        .def("position_of",
            [](const shuffleid::ShuffledSequence& self, const py::int_& value) {
                return self.position_of(domain_value(self.cipher(), value));
            },
            py::arg("value"))
        .def("materialize",
            [](const shuffleid::ShuffledSequence& self, const py::int_& start, const py::int_& count) {
                auto range = domain_range(self.cipher(), start, count);
                return self.materialize(range.first, range.second);
            },
            py::arg("start"), py::arg("count"))
        .def_property_readonly("cipher", &shuffleid::ShuffledSequence::cipher);
}
