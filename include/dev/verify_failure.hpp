#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace plonkish {

/**
 * VerifyFailure - One reason a witness does not satisfy the circuit
 *
 * Values are kept pre-formatted so that reports do not depend on the field type.
 */
struct VerifyFailure {
    enum class Kind {
        CellNotAssigned,         // A gate in a region reads an advice cell the region never wrote
        ConstraintNotSatisfied,  // A gate polynomial is non-zero on a row
        Permutation              // A cell differs from the cell it is copy-constrained to
    };

    Kind kind = Kind::ConstraintNotSatisfied;
    std::string gate;                 // CellNotAssigned, ConstraintNotSatisfied
    size_t constraint_index = 0;      // ConstraintNotSatisfied
    std::string region;               // Empty when the row is outside every region
    std::string column;               // CellNotAssigned, Permutation
    size_t row = 0;
    std::vector<std::pair<std::string, std::string>> cell_values;  // ConstraintNotSatisfied

    static VerifyFailure cell_not_assigned(const std::string& gate, const std::string& region,
                                           const std::string& column, size_t row);

    static VerifyFailure constraint_not_satisfied(
        const std::string& gate, size_t constraint_index, const std::string& region, size_t row,
        std::vector<std::pair<std::string, std::string>> cell_values);

    static VerifyFailure permutation(const std::string& column, size_t row,
                                     const std::string& region);

    std::string to_string() const;

    bool operator==(const VerifyFailure& rhs) const;
};

std::ostream& operator<<(std::ostream& os, const VerifyFailure& failure);

} // namespace plonkish
