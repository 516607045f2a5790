#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/debug_control.hpp"
#include "common/format.hpp"
#include "dev/verify_failure.hpp"
#include "plonk/assignment.hpp"
#include "plonk/constraint_system.hpp"
#include "plonk/error.hpp"
#include "plonk/permutation.hpp"
#include "plonk/region_record.hpp"

namespace plonkish {

/**
 * MockProver<F> - Witness-checking backend
 *
 * Synthesizes a circuit with its witness onto 2^k rows and checks, without
 * any cryptography, what a real proof would enforce: every gate polynomial
 * vanishes on every row and every copy constraint holds. Unassigned advice
 * cells read as zero.
 *
 * Usage:
 *   auto prover = MockProver<BFE>::run(4, circuit, {{BFE(41)}});
 *   for (const auto& failure : prover.verify()) std::cout << failure << "\n";
 */
template<typename F>
class MockProver : public Assignment<F> {
public:
    /**
     * Configure and synthesize circuit.
     *
     * @param k log2 of the number of rows
     * @param circuit Circuit carrying its witness
     * @param instance One vector of public inputs per instance column
     * @throws Error on invalid instances or any synthesis failure
     */
    template<typename C>
    static MockProver run(uint32_t k, const C& circuit, std::vector<std::vector<F>> instance) {
        auto start = std::chrono::high_resolution_clock::now();

        ConstraintSystem<F> cs;
        typename C::Config config = C::configure(cs);

        const size_t n = size_t(1) << k;
        if (instance.size() != cs.num_instance_columns()) {
            throw Error(ErrorKind::InvalidInstances,
                        "expected " + std::to_string(cs.num_instance_columns()) +
                        " instance columns, got " + std::to_string(instance.size()));
        }
        for (auto& column : instance) {
            if (column.size() > n) {
                throw Error(ErrorKind::InstanceTooLarge,
                            std::to_string(column.size()) + " public inputs do not fit in " +
                            std::to_string(n) + " rows");
            }
            column.resize(n, F::zero());
        }

        MockProver prover(k, std::move(cs), std::move(instance));
        C::FloorPlanner::template synthesize<F>(prover, circuit, config);

        PLONKISH_PROFILE_PRINT("[mock] synthesized %zu regions on 2^%u rows in %.3f ms\n",
                               prover.regions_.size(), k,
                               std::chrono::duration<double, std::milli>(
                                   std::chrono::high_resolution_clock::now() - start).count());
        return prover;
    }

    /**
     * Check every gate on every row and every copy constraint.
     * An empty result means the witness satisfies the circuit.
     */
    std::vector<VerifyFailure> verify() const {
        auto start = std::chrono::high_resolution_clock::now();
        std::vector<VerifyFailure> failures;

        // Gates inside a region may only read advice cells that region assigned
        for (const auto& region : regions_) {
            if (!region.rows) continue;
            for (size_t row = region.rows->first; row <= region.rows->second; ++row) {
                for (const auto& gate : cs_.gates()) {
                    for (const auto& query : gate.queried_cells) {
                        if (query.column.type != ColumnType::Advice) continue;
                        size_t cell_row = rotate(row, query.rotation);
                        if (!region.is_assigned(query.column, cell_row)) {
                            failures.push_back(VerifyFailure::cell_not_assigned(
                                gate.name, region.name,
                                cs_.column_annotation(query.column), cell_row));
                        }
                    }
                }
            }
        }

        std::vector<std::vector<VerifyFailure>> row_failures(n_);
        #pragma omp parallel for schedule(static)
        for (size_t row = 0; row < n_; ++row) {
            check_gates_at(row, row_failures[row]);
        }
        for (auto& at_row : row_failures) {
            failures.insert(failures.end(), at_row.begin(), at_row.end());
        }

        const auto& columns = permutation_.columns();
        const auto& mapping = permutation_.mapping();
        for (size_t i = 0; i < columns.size(); ++i) {
            for (size_t row = 0; row < n_; ++row) {
                const auto& next = mapping[i][row];
                if (!(cell_value(columns[i], row) == cell_value(columns[next.first], next.second))) {
                    failures.push_back(VerifyFailure::permutation(
                        cs_.column_annotation(columns[i]), row, region_name_at(row, &columns[i])));
                }
            }
        }

        PLONKISH_PROFILE_PRINT("[mock] verified %zu rows in %.3f ms\n", n_,
                               std::chrono::duration<double, std::milli>(
                                   std::chrono::high_resolution_clock::now() - start).count());
        PLONKISH_IF_DEBUG {
            for (const auto& failure : failures) {
                std::cout << "[mock] " << failure.to_string() << std::endl;
            }
        }
        return failures;
    }

    bool is_satisfied() const { return verify().empty(); }

    const ConstraintSystem<F>& cs() const { return cs_; }
    const std::vector<RegionRecord>& regions() const { return regions_; }
    const permutation::Assembly& permutation() const { return permutation_; }

    // std::nullopt when the cell was never assigned
    std::optional<F> advice_value(AdviceColumn column, size_t row) const {
        return advice_.at(column.index).at(row);
    }

    F fixed_value(FixedColumn column, size_t row) const {
        return fixed_.at(column.index).at(row);
    }

    F instance_value(InstanceColumn column, size_t row) const {
        return instance_.at(column.index).at(row);
    }

    // =========================================================================
    // Assignment<F>
    // =========================================================================

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
                       size_t row, const Value<Assigned<F>>& value) override {
        check_assignment("advice", annotation, column.index, advice_.size(), row);
        const auto& known = value.inner();
        if (!known) {
            throw Error::synthesis("advice cell '" + annotation + "' has no known value");
        }
        advice_[column.index][row] = known->evaluate();
        current_region_->track_cell(column.any(), row);
    }

    void assign_fixed(const std::string& annotation, FixedColumn column,
                      size_t row, const Value<Assigned<F>>& value) override {
        check_assignment("fixed", annotation, column.index, fixed_.size(), row);
        const auto& known = value.inner();
        if (!known) {
            throw Error::synthesis("fixed cell '" + annotation + "' has no known value");
        }
        fixed_[column.index][row] = known->evaluate();
        current_region_->track_cell(column.any(), row);
    }

    void copy(const AnyColumn& left_column, size_t left_row,
              const AnyColumn& right_column, size_t right_row) override {
        permutation_.copy(left_column, left_row, right_column, right_row);
    }

    Value<F> query_instance(InstanceColumn column, size_t row) const override {
        if (row >= n_) {
            throw Error::bounds_failure("instance", row, n_);
        }
        return Value<F>::known(instance_.at(column.index)[row]);
    }

    size_t usable_rows() const override { return n_; }
    uint32_t k() const override { return k_; }

private:
    MockProver(uint32_t k, ConstraintSystem<F> cs, std::vector<std::vector<F>> instance)
        : k_(k),
          n_(size_t(1) << k),
          cs_(std::move(cs)),
          advice_(cs_.num_advice_columns(), std::vector<std::optional<F>>(n_)),
          fixed_(cs_.num_fixed_columns(), std::vector<F>(n_, F::zero())),
          instance_(std::move(instance)),
          permutation_(n_, cs_.permutation_columns()) {}

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

    size_t rotate(size_t row, Rotation rotation) const {
        int64_t n = static_cast<int64_t>(n_);
        int64_t r = (static_cast<int64_t>(row) + rotation.value) % n;
        return static_cast<size_t>(r < 0 ? r + n : r);
    }

    F cell_value(const AnyColumn& column, size_t row) const {
        switch (column.type) {
            case ColumnType::Advice: return advice_[column.index][row].value_or(F::zero());
            case ColumnType::Fixed: return fixed_[column.index][row];
            case ColumnType::Instance: return instance_[column.index][row];
        }
        return F::zero();
    }

    // Name of the first region covering row (and column, when given)
    std::string region_name_at(size_t row, const AnyColumn* column = nullptr) const {
        for (const auto& region : regions_) {
            if (!region.contains_row(row)) continue;
            if (column && !region.columns.count(*column)) continue;
            return region.name;
        }
        return "";
    }

    void check_gates_at(size_t row, std::vector<VerifyFailure>& out) const {
        auto query_value = [this, row](const Query& q) {
            return cell_value(q.column, rotate(row, q.rotation));
        };
        for (const auto& gate : cs_.gates()) {
            for (size_t i = 0; i < gate.polynomials.size(); ++i) {
                F value = gate.polynomials[i].evaluate(query_value);
                if (value == F::zero()) continue;

                std::vector<std::pair<std::string, std::string>> cells;
                for (const auto& q : gate.queried_cells) {
                    cells.emplace_back(cs_.column_annotation(q.column),
                                       format_field(query_value(q)));
                }
                out.push_back(VerifyFailure::constraint_not_satisfied(
                    gate.name, i, region_name_at(row), row, std::move(cells)));
            }
        }
    }

    uint32_t k_;
    size_t n_;
    ConstraintSystem<F> cs_;

    std::vector<RegionRecord> regions_;
    std::optional<RegionRecord> current_region_;

    std::vector<std::vector<std::optional<F>>> advice_;
    std::vector<std::vector<F>> fixed_;
    std::vector<std::vector<F>> instance_;
    permutation::Assembly permutation_;
};

} // namespace plonkish
