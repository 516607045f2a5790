#pragma once

#include <cstddef>
#include "circuit/assigned.hpp"
#include "circuit/value.hpp"
#include "plonk/column.hpp"

namespace plonkish {

/**
 * Cell - Address of an assigned cell, relative to its region
 *
 * Absolute rows are only known once the floor planner has placed the region.
 */
struct Cell {
    size_t region_index = 0;
    size_t row_offset = 0;
    AnyColumn column;

    bool operator==(const Cell& rhs) const {
        return region_index == rhs.region_index && row_offset == rhs.row_offset
            && column == rhs.column;
    }
    bool operator!=(const Cell& rhs) const { return !(*this == rhs); }
};

// A cell together with the value written into it
template<typename F>
struct AssignedCell {
    Value<Assigned<F>> value;
    Cell cell;
};

} // namespace plonkish
