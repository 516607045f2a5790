#include "plonk/permutation.hpp"
#include <algorithm>
#include "plonk/error.hpp"

namespace plonkish {
namespace permutation {

Assembly::Assembly(size_t usable_rows, std::vector<AnyColumn> columns)
    : usable_rows_(usable_rows), columns_(std::move(columns)) {
    mapping_.resize(columns_.size());
    aux_.resize(columns_.size());
    sizes_.resize(columns_.size());
    for (size_t i = 0; i < columns_.size(); ++i) {
        mapping_[i].reserve(usable_rows_);
        for (size_t j = 0; j < usable_rows_; ++j) {
            mapping_[i].emplace_back(i, j);
        }
        aux_[i] = mapping_[i];
        sizes_[i].assign(usable_rows_, 1);
    }
}

size_t Assembly::column_position(const AnyColumn& column) const {
    auto it = std::find(columns_.begin(), columns_.end(), column);
    if (it == columns_.end()) {
        throw Error::column_not_in_permutation(column.to_string());
    }
    return static_cast<size_t>(it - columns_.begin());
}

void Assembly::check_row(size_t row) const {
    if (row >= usable_rows_) {
        throw Error::bounds_failure("copy constraint", row, usable_rows_);
    }
}

void Assembly::copy(const AnyColumn& left_column, size_t left_row,
                    const AnyColumn& right_column, size_t right_row) {
    size_t left_col = column_position(left_column);
    size_t right_col = column_position(right_column);
    check_row(left_row);
    check_row(right_row);

    ++num_copies_;

    CellRef left_cycle = aux_[left_col][left_row];
    CellRef right_cycle = aux_[right_col][right_row];
    if (left_cycle == right_cycle) {
        return;
    }

    // Relabel the smaller cycle
    if (sizes_[left_cycle.first][left_cycle.second] < sizes_[right_cycle.first][right_cycle.second]) {
        std::swap(left_cycle, right_cycle);
    }

    sizes_[left_cycle.first][left_cycle.second] += sizes_[right_cycle.first][right_cycle.second];

    CellRef cell = right_cycle;
    do {
        aux_[cell.first][cell.second] = left_cycle;
        cell = mapping_[cell.first][cell.second];
    } while (cell != right_cycle);

    // Splice the two cycles together
    std::swap(mapping_[left_col][left_row], mapping_[right_col][right_row]);
}

bool Assembly::in_same_cycle(const AnyColumn& a, size_t a_row,
                             const AnyColumn& b, size_t b_row) const {
    size_t a_col = column_position(a);
    size_t b_col = column_position(b);
    check_row(a_row);
    check_row(b_row);
    return aux_[a_col][a_row] == aux_[b_col][b_row];
}

} // namespace permutation
} // namespace plonkish
