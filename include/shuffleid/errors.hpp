/**
 * ShuffleID — Reversible integer shuffling
 *
 * Exception types
 *
 * ConfigurationError is raised while building a schedule or a cipher,
 * DomainError by encode/decode for values outside [0, 2^bit_size).
 */

#ifndef SHUFFLEID_ERRORS_HPP
#define SHUFFLEID_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace shuffleid {

/** Invalid bit size, round count or round table */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/** Value outside the cipher's domain */
class DomainError : public std::out_of_range {
public:
    explicit DomainError(const std::string& what)
        : std::out_of_range(what) {}
};

} // namespace shuffleid

#endif // SHUFFLEID_ERRORS_HPP
