#include "plonk/error.hpp"

namespace plonkish {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Synthesis: return "Synthesis";
        case ErrorKind::InvalidInstances: return "InvalidInstances";
        case ErrorKind::BoundsFailure: return "BoundsFailure";
        case ErrorKind::NotEnoughRowsAvailable: return "NotEnoughRowsAvailable";
        case ErrorKind::InstanceTooLarge: return "InstanceTooLarge";
        case ErrorKind::ColumnNotInPermutation: return "ColumnNotInPermutation";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(to_string(kind) + ": " + detail), kind_(kind) {}

Error Error::synthesis(const std::string& detail) {
    return Error(ErrorKind::Synthesis, detail);
}

Error Error::bounds_failure(const std::string& what, size_t row, size_t usable_rows) {
    return Error(ErrorKind::BoundsFailure,
                 what + " row " + std::to_string(row) +
                 " is outside the usable rows [0, " + std::to_string(usable_rows) + ")");
}

Error Error::not_enough_rows(uint32_t current_k) {
    return Error(ErrorKind::NotEnoughRowsAvailable,
                 "circuit does not fit in 2^" + std::to_string(current_k) +
                 " rows, try a larger k");
}

Error Error::column_not_in_permutation(const std::string& column) {
    return Error(ErrorKind::ColumnNotInPermutation,
                 "column " + column + " does not have equality enabled");
}

} // namespace plonkish
