#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace plonkish {

/**
 * Failure categories surfaced while configuring or synthesizing a circuit.
 *
 * None of these are retried: an Error aborts the current synthesis or
 * key-derivation attempt and reaches the caller unchanged.
 */
enum class ErrorKind {
    Synthesis,              // A witness value was required but unknown, or region misuse
    InvalidInstances,       // Instance vectors do not match the instance columns
    BoundsFailure,          // A row lies outside the usable rows of the circuit
    NotEnoughRowsAvailable, // Layout needs more rows than 2^k provides
    InstanceTooLarge,       // An instance vector is longer than the usable rows
    ColumnNotInPermutation  // Equality requested on a column without equality enabled
};

std::string to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& detail);

    static Error synthesis(const std::string& detail);
    static Error bounds_failure(const std::string& what, size_t row, size_t usable_rows);
    static Error not_enough_rows(uint32_t current_k);
    static Error column_not_in_permutation(const std::string& column);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace plonkish
