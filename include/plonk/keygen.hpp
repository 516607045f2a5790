#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/debug_control.hpp"
#include "common/format.hpp"
#include "plonk/assignment.hpp"
#include "plonk/circuit_shape.hpp"
#include "plonk/constraint_system.hpp"
#include "plonk/error.hpp"
#include "plonk/permutation.hpp"
#include "plonk/region_record.hpp"

namespace plonkish {
namespace keygen {

/**
 * Assembly<F> - Shape-only backend
 *
 * Records fixed columns, copy constraints and region layout. Advice values
 * are never read, so it accepts circuits whose witness is unknown, and
 * instance queries answer unknown.
 */
template<typename F>
class Assembly : public Assignment<F> {
public:
    Assembly(uint32_t k, const ConstraintSystem<F>& cs)
        : k_(k),
          n_(size_t(1) << k),
          num_advice_columns_(cs.num_advice_columns()),
          num_instance_columns_(cs.num_instance_columns()),
          fixed_(cs.num_fixed_columns(), std::vector<F>(n_, F::zero())),
          permutation_(n_, cs.permutation_columns()) {}

    void enter_region(const std::string& name) override {
        if (current_region_) {
            throw Error::synthesis("region '" + name + "' entered inside region '" +
                                   current_region_->name + "'");
        }
        current_region_.emplace(name);
    }

    void exit_region() override {
        if (!current_region_) {
            throw Error::synthesis("exit_region called outside of a region");
        }
        regions_.push_back(std::move(*current_region_));
        current_region_.reset();
    }

    void abort_region() override {
        current_region_.reset();
    }

    void assign_advice(const std::string& annotation, AdviceColumn column,
                       size_t row, const Value<Assigned<F>>&) override {
        check_assignment("advice", annotation, column.index, num_advice_columns_, row);
        current_region_->track_cell(column.any(), row);
    }

    void assign_fixed(const std::string& annotation, FixedColumn column,
                      size_t row, const Value<Assigned<F>>& value) override {
        check_assignment("fixed", annotation, column.index, fixed_.size(), row);
        const auto& known = value.inner();
        if (!known) {
            throw Error::synthesis("fixed cell '" + annotation + "' must be known at key generation");
        }
        fixed_[column.index][row] = known->evaluate();
        current_region_->track_cell(column.any(), row);
    }

    void copy(const AnyColumn& left_column, size_t left_row,
              const AnyColumn& right_column, size_t right_row) override {
        permutation_.copy(left_column, left_row, right_column, right_row);
    }

    Value<F> query_instance(InstanceColumn column, size_t row) const override {
        if (column.index >= num_instance_columns_) {
            throw Error::synthesis("instance column " + std::to_string(column.index) +
                                   " was never declared");
        }
        if (row >= n_) {
            throw Error::bounds_failure("instance", row, n_);
        }
        return Value<F>::unknown();
    }

    size_t usable_rows() const override { return n_; }
    uint32_t k() const override { return k_; }

    const std::vector<RegionRecord>& regions() const { return regions_; }
    const std::vector<std::vector<F>>& fixed() const { return fixed_; }
    const permutation::Assembly& permutation() const { return permutation_; }

private:
    void check_assignment(const char* kind, const std::string& annotation,
                          size_t column, size_t num_columns, size_t row) const {
        if (!current_region_) {
            throw Error::synthesis(std::string(kind) + " cell '" + annotation +
                                   "' assigned outside of a region");
        }
        if (column >= num_columns) {
            throw Error::synthesis(std::string(kind) + " column " + std::to_string(column) +
                                   " was never declared");
        }
        if (row >= n_) {
            throw Error::bounds_failure(kind, row, n_);
        }
    }

    uint32_t k_;
    size_t n_;
    size_t num_advice_columns_;
    size_t num_instance_columns_;

    std::vector<RegionRecord> regions_;
    std::optional<RegionRecord> current_region_;
    std::vector<std::vector<F>> fixed_;
    permutation::Assembly permutation_;
};

/**
 * Derive the circuit shape on 2^k rows.
 *
 * Whatever witness circuit carries is ignored; passing
 * circuit.without_witnesses() and passing a witness-bearing circuit must
 * produce equal shapes.
 *
 * @throws Error if the layout does not fit or constraints are misconfigured
 */
template<typename F, typename C>
CircuitShape derive_shape(uint32_t k, const C& circuit) {
    auto start = std::chrono::high_resolution_clock::now();

    ConstraintSystem<F> cs;
    typename C::Config config = C::configure(cs);

    Assembly<F> assembly(k, cs);
    C::FloorPlanner::template synthesize<F>(assembly, circuit, config);

    CircuitShape shape;
    shape.k = k;
    for (size_t i = 0; i < cs.num_advice_columns(); ++i) {
        shape.advice_columns.push_back(cs.column_annotation(AnyColumn{ColumnType::Advice, i}));
    }
    for (size_t i = 0; i < cs.num_fixed_columns(); ++i) {
        shape.fixed_columns.push_back(cs.column_annotation(AnyColumn{ColumnType::Fixed, i}));
    }
    for (size_t i = 0; i < cs.num_instance_columns(); ++i) {
        shape.instance_columns.push_back(cs.column_annotation(AnyColumn{ColumnType::Instance, i}));
    }

    auto name_of = [&cs](const AnyColumn& column) { return cs.column_annotation(column); };
    for (const auto& gate : cs.gates()) {
        CircuitShape::GateShape g;
        g.name = gate.name;
        for (const auto& poly : gate.polynomials) {
            g.constraints.push_back(poly.to_string(name_of));
            g.degree = std::max(g.degree, poly.degree());
        }
        shape.gates.push_back(std::move(g));
    }

    shape.permutation_columns = cs.permutation_columns();
    shape.regions = assembly.regions();

    const auto& fixed = assembly.fixed();
    for (size_t c = 0; c < fixed.size(); ++c) {
        for (size_t row = 0; row < fixed[c].size(); ++row) {
            if (fixed[c][row] == F::zero()) continue;
            shape.fixed.push_back(CircuitShape::FixedCell{c, row, format_field(fixed[c][row])});
        }
    }
    shape.copy_mapping = assembly.permutation().mapping();

    PLONKISH_PROFILE_PRINT("[keygen] derived shape with %zu regions in %.3f ms\n",
                           shape.regions.size(),
                           std::chrono::duration<double, std::milli>(
                               std::chrono::high_resolution_clock::now() - start).count());
    return shape;
}

} // namespace keygen
} // namespace plonkish
