#include "plonk/region_record.hpp"
#include <algorithm>

namespace plonkish {

void RegionRecord::track_cell(const AnyColumn& column, size_t row) {
    if (rows) {
        rows->first = std::min(rows->first, row);
        rows->second = std::max(rows->second, row);
    } else {
        rows = std::make_pair(row, row);
    }
    columns.insert(column);
    cells.emplace(column, row);
}

bool RegionRecord::contains_row(size_t row) const {
    return rows && row >= rows->first && row <= rows->second;
}

bool RegionRecord::is_assigned(const AnyColumn& column, size_t row) const {
    return cells.count(std::make_pair(column, row)) > 0;
}

size_t RegionRecord::num_rows() const {
    return rows ? rows->second - rows->first + 1 : 0;
}

bool RegionRecord::operator==(const RegionRecord& rhs) const {
    return name == rhs.name && rows == rhs.rows && columns == rhs.columns && cells == rhs.cells;
}

} // namespace plonkish
