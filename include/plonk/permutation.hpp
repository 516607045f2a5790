#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "plonk/column.hpp"

namespace plonkish {
namespace permutation {

// (position in the permutation column list, row)
using CellRef = std::pair<size_t, size_t>;

/**
 * Assembly - Copy constraints as permutation cycles
 *
 * Every cell of an equality-enabled column starts in its own cycle. copy()
 * merges the cycles of two cells, so equality is symmetric and transitive by
 * construction: the backend's permutation argument then only has to check
 * that each cell equals its successor on the cycle.
 */
class Assembly {
public:
    Assembly(size_t usable_rows, std::vector<AnyColumn> columns);

    /**
     * Constrain (left_column, left_row) == (right_column, right_row).
     * Throws ColumnNotInPermutation if a column lacks equality and
     * BoundsFailure if a row is not usable.
     */
    void copy(const AnyColumn& left_column, size_t left_row,
              const AnyColumn& right_column, size_t right_row);

    bool in_same_cycle(const AnyColumn& a, size_t a_row,
                       const AnyColumn& b, size_t b_row) const;

    const std::vector<AnyColumn>& columns() const { return columns_; }
    size_t usable_rows() const { return usable_rows_; }
    size_t num_copies() const { return num_copies_; }

    // Successor of a cell on its cycle; a cell alone in its cycle maps to itself
    const std::vector<std::vector<CellRef>>& mapping() const { return mapping_; }

private:
    size_t column_position(const AnyColumn& column) const;
    void check_row(size_t row) const;

    size_t usable_rows_;
    std::vector<AnyColumn> columns_;
    std::vector<std::vector<CellRef>> mapping_;
    std::vector<std::vector<CellRef>> aux_;     // Cycle representative
    std::vector<std::vector<size_t>> sizes_;    // Cycle size, valid at representatives
    size_t num_copies_ = 0;
};

} // namespace permutation
} // namespace plonkish
