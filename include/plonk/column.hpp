#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

namespace plonkish {

/**
 * Column kinds:
 * - Advice: private witness values, supplied per proof
 * - Fixed: circuit-shape constants (selectors), identical for every proof
 * - Instance: public inputs, supplied at verification time
 */
enum class ColumnType {
    Advice,
    Fixed,
    Instance
};

std::string to_string(ColumnType type);

/**
 * AnyColumn - A column handle with its kind erased
 *
 * Indices are per kind: advice column 0 and fixed column 0 are distinct.
 */
struct AnyColumn {
    ColumnType type = ColumnType::Advice;
    size_t index = 0;

    bool operator==(const AnyColumn& rhs) const {
        return type == rhs.type && index == rhs.index;
    }
    bool operator!=(const AnyColumn& rhs) const { return !(*this == rhs); }
    bool operator<(const AnyColumn& rhs) const {
        return std::tie(type, index) < std::tie(rhs.type, rhs.index);
    }

    // "advice[1]", "fixed[3]", ...
    std::string to_string() const;
};

/**
 * Column<T> - A typed column handle
 *
 * Handles are only created by ConstraintSystem and never change identity.
 */
template<ColumnType T>
struct Column {
    static constexpr ColumnType TYPE = T;

    size_t index = 0;

    constexpr Column() = default;
    constexpr explicit Column(size_t idx) : index(idx) {}

    AnyColumn any() const { return AnyColumn{T, index}; }
    operator AnyColumn() const { return any(); }

    bool operator==(const Column& rhs) const { return index == rhs.index; }
    bool operator!=(const Column& rhs) const { return index != rhs.index; }
};

using AdviceColumn = Column<ColumnType::Advice>;
using FixedColumn = Column<ColumnType::Fixed>;
using InstanceColumn = Column<ColumnType::Instance>;

/**
 * Rotation - Row offset of a query relative to the row being checked
 */
struct Rotation {
    int32_t value = 0;

    static constexpr Rotation cur() { return Rotation{0}; }
    static constexpr Rotation next() { return Rotation{1}; }
    static constexpr Rotation prev() { return Rotation{-1}; }

    bool operator==(const Rotation& rhs) const { return value == rhs.value; }
    bool operator!=(const Rotation& rhs) const { return value != rhs.value; }
    bool operator<(const Rotation& rhs) const { return value < rhs.value; }
};

} // namespace plonkish
