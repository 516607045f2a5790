#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include "plonk/column.hpp"

namespace plonkish {

/**
 * RegionRecord - What a backend observed of one laid-out region
 *
 * Rows are absolute. A region that assigns nothing (for example one that
 * only adds copy constraints) has no row span.
 */
struct RegionRecord {
    std::string name;
    std::optional<std::pair<size_t, size_t>> rows;  // Inclusive [first, last]
    std::set<AnyColumn> columns;
    std::set<std::pair<AnyColumn, size_t>> cells;

    RegionRecord() = default;
    explicit RegionRecord(std::string region_name) : name(std::move(region_name)) {}

    void track_cell(const AnyColumn& column, size_t row);

    bool contains_row(size_t row) const;
    bool is_assigned(const AnyColumn& column, size_t row) const;
    size_t num_rows() const;

    bool operator==(const RegionRecord& rhs) const;
    bool operator!=(const RegionRecord& rhs) const { return !(*this == rhs); }
};

} // namespace plonkish
