#include "plonk/circuit_shape.hpp"

namespace plonkish {

bool CircuitShape::operator==(const CircuitShape& rhs) const {
    return k == rhs.k
        && advice_columns == rhs.advice_columns
        && fixed_columns == rhs.fixed_columns
        && instance_columns == rhs.instance_columns
        && gates == rhs.gates
        && permutation_columns == rhs.permutation_columns
        && regions == rhs.regions
        && fixed == rhs.fixed
        && copy_mapping == rhs.copy_mapping;
}

namespace {

std::string column_name(const CircuitShape& shape, const AnyColumn& column) {
    const std::vector<std::string>* names = nullptr;
    switch (column.type) {
        case ColumnType::Advice: names = &shape.advice_columns; break;
        case ColumnType::Fixed: names = &shape.fixed_columns; break;
        case ColumnType::Instance: names = &shape.instance_columns; break;
    }
    if (names && column.index < names->size()) {
        return (*names)[column.index];
    }
    return column.to_string();
}

} // namespace

nlohmann::json CircuitShape::to_json() const {
    nlohmann::json json;
    json["k"] = k;
    json["rows"] = num_rows();
    json["columns"] = {
        {"advice", advice_columns},
        {"fixed", fixed_columns},
        {"instance", instance_columns}
    };

    nlohmann::json gates_json = nlohmann::json::array();
    for (const auto& gate : gates) {
        gates_json.push_back({
            {"name", gate.name},
            {"degree", gate.degree},
            {"constraints", gate.constraints}
        });
    }
    json["gates"] = gates_json;

    nlohmann::json equality = nlohmann::json::array();
    for (const auto& column : permutation_columns) {
        equality.push_back(column_name(*this, column));
    }
    json["equality"] = equality;

    nlohmann::json regions_json = nlohmann::json::array();
    for (const auto& region : regions) {
        nlohmann::json r;
        r["name"] = region.name;
        if (region.rows) {
            r["rows"] = {region.rows->first, region.rows->second};
        } else {
            r["rows"] = nullptr;
        }
        nlohmann::json columns = nlohmann::json::array();
        for (const auto& column : region.columns) {
            columns.push_back(column_name(*this, column));
        }
        r["columns"] = columns;
        regions_json.push_back(r);
    }
    json["regions"] = regions_json;

    nlohmann::json fixed_json = nlohmann::json::array();
    for (const auto& cell : fixed) {
        fixed_json.push_back({
            {"column", column_name(*this, AnyColumn{ColumnType::Fixed, cell.column})},
            {"row", cell.row},
            {"value", cell.value}
        });
    }
    json["fixed"] = fixed_json;

    // Walk each non-trivial cycle once, starting from its first cell
    nlohmann::json cycles = nlohmann::json::array();
    std::vector<std::vector<bool>> seen(copy_mapping.size());
    for (size_t c = 0; c < copy_mapping.size(); ++c) {
        seen[c].assign(copy_mapping[c].size(), false);
    }
    for (size_t c = 0; c < copy_mapping.size(); ++c) {
        for (size_t row = 0; row < copy_mapping[c].size(); ++row) {
            if (seen[c][row] || copy_mapping[c][row] == permutation::CellRef(c, row)) continue;
            nlohmann::json cycle = nlohmann::json::array();
            permutation::CellRef cell(c, row);
            do {
                seen[cell.first][cell.second] = true;
                cycle.push_back({
                    {"column", column_name(*this, permutation_columns[cell.first])},
                    {"row", cell.second}
                });
                cell = copy_mapping[cell.first][cell.second];
            } while (cell != permutation::CellRef(c, row));
            cycles.push_back(cycle);
        }
    }
    json["copy_cycles"] = cycles;

    return json;
}

} // namespace plonkish
