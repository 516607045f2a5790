#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "circuit/assigned.hpp"
#include "circuit/value.hpp"
#include "plonk/column.hpp"

namespace plonkish {

/**
 * Assignment<F> - Backend sink for a synthesis pass
 *
 * A layouter drives one Assignment per pass with absolute rows. Key
 * derivation implements it without ever reading advice values; witness
 * generation stores everything. Failures are reported by throwing Error.
 */
template<typename F>
class Assignment {
public:
    virtual ~Assignment() = default;

    virtual void enter_region(const std::string& name) = 0;
    virtual void exit_region() = 0;

    // Drop the open region without recording it; a no-op when none is open
    virtual void abort_region() = 0;

    virtual void assign_advice(const std::string& annotation, AdviceColumn column,
                               size_t row, const Value<Assigned<F>>& value) = 0;

    virtual void assign_fixed(const std::string& annotation, FixedColumn column,
                              size_t row, const Value<Assigned<F>>& value) = 0;

    // Equality constraint between two cells of equality-enabled columns
    virtual void copy(const AnyColumn& left_column, size_t left_row,
                      const AnyColumn& right_column, size_t right_row) = 0;

    // Unknown when the backend does not hold instance values
    virtual Value<F> query_instance(InstanceColumn column, size_t row) const = 0;

    virtual size_t usable_rows() const = 0;
    virtual uint32_t k() const = 0;
};

} // namespace plonkish
