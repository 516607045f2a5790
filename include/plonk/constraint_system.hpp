#pragma once

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "plonk/column.hpp"
#include "plonk/expression.hpp"

namespace plonkish {

/**
 * VirtualCells - Query builder handed to a gate definition
 *
 * Records every cell the gate reads so that backends know which cells a gate
 * depends on.
 */
template<typename F>
class VirtualCells {
public:
    Expression<F> query_advice(AdviceColumn column, Rotation at) {
        return record(Query{column.any(), at});
    }

    Expression<F> query_fixed(FixedColumn column, Rotation at) {
        return record(Query{column.any(), at});
    }

    Expression<F> query_instance(InstanceColumn column, Rotation at) {
        return record(Query{column.any(), at});
    }

    const std::vector<Query>& queried_cells() const { return queried_; }

private:
    Expression<F> record(const Query& q) {
        if (std::find(queried_.begin(), queried_.end(), q) == queried_.end()) {
            queried_.push_back(q);
        }
        return Expression<F>::query(q);
    }

    std::vector<Query> queried_;
};

/**
 * Gate - A named set of polynomial constraints checked on every row
 */
template<typename F>
struct Gate {
    std::string name;
    std::vector<Expression<F>> polynomials;
    std::vector<Query> queried_cells;
};

/**
 * ConstraintSystem<F> - Circuit shape builder
 *
 * Columns, equality permissions and gates are declared here once per circuit
 * type, before and independently of any witness.
 */
template<typename F>
class ConstraintSystem {
public:
    AdviceColumn advice_column() { return AdviceColumn(num_advice_columns_++); }
    FixedColumn fixed_column() { return FixedColumn(num_fixed_columns_++); }
    InstanceColumn instance_column() { return InstanceColumn(num_instance_columns_++); }

    /**
     * Allow the column to take part in copy constraints.
     * Enabling a column twice is a no-op.
     */
    void enable_equality(const AnyColumn& column) {
        if (!is_equality_enabled(column)) {
            permutation_columns_.push_back(column);
        }
    }

    bool is_equality_enabled(const AnyColumn& column) const {
        return std::find(permutation_columns_.begin(), permutation_columns_.end(), column)
            != permutation_columns_.end();
    }

    // Names used in diagnostics and layout exports
    void annotate_column(const AnyColumn& column, const std::string& name) {
        annotations_[column] = name;
    }

    std::string column_annotation(const AnyColumn& column) const {
        auto it = annotations_.find(column);
        if (it != annotations_.end()) {
            return it->second;
        }
        return column.to_string();
    }

    /**
     * Register a gate. build receives a VirtualCells<F>& and returns the
     * gate's constraint polynomials; a gate without constraints is rejected.
     */
    template<typename Build>
    void create_gate(const std::string& name, Build&& build) {
        VirtualCells<F> cells;
        std::vector<Expression<F>> polys = build(cells);
        if (polys.empty()) {
            throw std::invalid_argument("gate '" + name + "' must contain at least one constraint");
        }
        gates_.push_back(Gate<F>{name, std::move(polys), cells.queried_cells()});
    }

    // Maximum constraint degree over all gates
    size_t degree() const {
        size_t d = 1;
        for (const auto& gate : gates_) {
            for (const auto& poly : gate.polynomials) {
                d = std::max(d, poly.degree());
            }
        }
        return d;
    }

    size_t num_advice_columns() const { return num_advice_columns_; }
    size_t num_fixed_columns() const { return num_fixed_columns_; }
    size_t num_instance_columns() const { return num_instance_columns_; }

    const std::vector<Gate<F>>& gates() const { return gates_; }
    const std::vector<AnyColumn>& permutation_columns() const { return permutation_columns_; }

private:
    size_t num_advice_columns_ = 0;
    size_t num_fixed_columns_ = 0;
    size_t num_instance_columns_ = 0;

    std::vector<Gate<F>> gates_;
    std::vector<AnyColumn> permutation_columns_;
    std::map<AnyColumn, std::string> annotations_;
};

} // namespace plonkish
