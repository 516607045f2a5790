#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "plonk/column.hpp"
#include "plonk/permutation.hpp"
#include "plonk/region_record.hpp"

namespace plonkish {

/**
 * CircuitShape - Everything keys are derived from, and nothing more
 *
 * Produced by keygen::derive_shape. It carries no advice values, so two
 * synthesis passes that differ only in their witness yield equal shapes.
 */
struct CircuitShape {
    struct GateShape {
        std::string name;
        std::vector<std::string> constraints;  // Rendered with column annotations
        size_t degree = 0;

        bool operator==(const GateShape& rhs) const {
            return name == rhs.name && constraints == rhs.constraints && degree == rhs.degree;
        }
    };

    struct FixedCell {
        size_t column = 0;
        size_t row = 0;
        std::string value;

        bool operator==(const FixedCell& rhs) const {
            return column == rhs.column && row == rhs.row && value == rhs.value;
        }
    };

    uint32_t k = 0;
    std::vector<std::string> advice_columns;    // Annotations, by index
    std::vector<std::string> fixed_columns;
    std::vector<std::string> instance_columns;
    std::vector<GateShape> gates;
    std::vector<AnyColumn> permutation_columns;
    std::vector<RegionRecord> regions;
    std::vector<FixedCell> fixed;                 // Non-zero cells, column-major
    std::vector<std::vector<permutation::CellRef>> copy_mapping;

    size_t num_rows() const { return size_t(1) << k; }

    bool operator==(const CircuitShape& rhs) const;
    bool operator!=(const CircuitShape& rhs) const { return !(*this == rhs); }

    /**
     * Export the layout, with copy constraints listed as the cycles of the
     * permutation.
     */
    nlohmann::json to_json() const;
};

} // namespace plonkish
