#include "plonk/column.hpp"

namespace plonkish {

std::string to_string(ColumnType type) {
    switch (type) {
        case ColumnType::Advice: return "advice";
        case ColumnType::Fixed: return "fixed";
        case ColumnType::Instance: return "instance";
    }
    return "unknown";
}

std::string AnyColumn::to_string() const {
    return plonkish::to_string(type) + "[" + std::to_string(index) + "]";
}

} // namespace plonkish
