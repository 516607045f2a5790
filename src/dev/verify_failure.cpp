#include "dev/verify_failure.hpp"
#include <sstream>

namespace plonkish {

VerifyFailure VerifyFailure::cell_not_assigned(const std::string& gate, const std::string& region,
                                               const std::string& column, size_t row) {
    VerifyFailure f;
    f.kind = Kind::CellNotAssigned;
    f.gate = gate;
    f.region = region;
    f.column = column;
    f.row = row;
    return f;
}

VerifyFailure VerifyFailure::constraint_not_satisfied(
    const std::string& gate, size_t constraint_index, const std::string& region, size_t row,
    std::vector<std::pair<std::string, std::string>> cell_values) {
    VerifyFailure f;
    f.kind = Kind::ConstraintNotSatisfied;
    f.gate = gate;
    f.constraint_index = constraint_index;
    f.region = region;
    f.row = row;
    f.cell_values = std::move(cell_values);
    return f;
}

VerifyFailure VerifyFailure::permutation(const std::string& column, size_t row,
                                         const std::string& region) {
    VerifyFailure f;
    f.kind = Kind::Permutation;
    f.column = column;
    f.row = row;
    f.region = region;
    return f;
}

std::string VerifyFailure::to_string() const {
    std::ostringstream os;
    const std::string where = region.empty() ? "outside any region" : "in region '" + region + "'";
    switch (kind) {
        case Kind::CellNotAssigned:
            os << "Gate '" << gate << "' " << where << " uses unassigned cell "
               << column << " at row " << row;
            break;
        case Kind::ConstraintNotSatisfied:
            os << "Constraint " << constraint_index << " of gate '" << gate
               << "' is not satisfied " << where << " at row " << row;
            if (!cell_values.empty()) {
                os << " (";
                for (size_t i = 0; i < cell_values.size(); ++i) {
                    if (i > 0) os << ", ";
                    os << cell_values[i].first << " = " << cell_values[i].second;
                }
                os << ")";
            }
            break;
        case Kind::Permutation:
            os << "Equality constraint not satisfied by cell " << column
               << " at row " << row << " " << where;
            break;
    }
    return os.str();
}

bool VerifyFailure::operator==(const VerifyFailure& rhs) const {
    return kind == rhs.kind && gate == rhs.gate && constraint_index == rhs.constraint_index
        && region == rhs.region && column == rhs.column && row == rhs.row
        && cell_values == rhs.cell_values;
}

std::ostream& operator<<(std::ostream& os, const VerifyFailure& failure) {
    return os << failure.to_string();
}

} // namespace plonkish
