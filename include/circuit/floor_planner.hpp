#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include "circuit/layouter.hpp"
#include "common/debug_control.hpp"
#include "plonk/assignment.hpp"
#include "plonk/error.hpp"

namespace plonkish {

/**
 * RegionRecorder<F> - Buffers one region body's assignments
 *
 * The body runs once; the layouter places the region from what was recorded
 * and then replays it into the backend.
 */
template<typename F>
class RegionRecorder : public RegionLayouter<F> {
public:
    struct PendingAdvice {
        std::string annotation;
        AdviceColumn column;
        size_t offset;
        Value<Assigned<F>> value;
    };

    struct PendingFixed {
        std::string annotation;
        FixedColumn column;
        size_t offset;
        Value<Assigned<F>> value;
    };

    explicit RegionRecorder(size_t region_index) : region_index_(region_index) {}

    Cell assign_advice(const std::string& annotation, AdviceColumn column,
                       size_t offset, const Value<Assigned<F>>& value) override {
        advice_.push_back(PendingAdvice{annotation, column, offset, value});
        return track(column.any(), offset);
    }

    Cell assign_fixed(const std::string& annotation, FixedColumn column,
                      size_t offset, const Value<Assigned<F>>& value) override {
        fixed_.push_back(PendingFixed{annotation, column, offset, value});
        return track(column.any(), offset);
    }

    void constrain_equal(const Cell& left, const Cell& right) override {
        equalities_.emplace_back(left, right);
    }

    const std::vector<PendingAdvice>& advice() const { return advice_; }
    const std::vector<PendingFixed>& fixed() const { return fixed_; }
    const std::vector<std::pair<Cell, Cell>>& equalities() const { return equalities_; }
    const std::vector<AnyColumn>& columns() const { return columns_; }
    size_t num_rows() const { return num_rows_; }

private:
    Cell track(const AnyColumn& column, size_t offset) {
        if (std::find(columns_.begin(), columns_.end(), column) == columns_.end()) {
            columns_.push_back(column);
        }
        num_rows_ = std::max(num_rows_, offset + 1);
        return Cell{region_index_, offset, column};
    }

    size_t region_index_;
    std::vector<PendingAdvice> advice_;
    std::vector<PendingFixed> fixed_;
    std::vector<std::pair<Cell, Cell>> equalities_;
    std::vector<AnyColumn> columns_;
    size_t num_rows_ = 0;
};

/**
 * SingleChipLayouter<F> - Greedy single-pass placement
 *
 * Each region starts at the first row where every column it touches is free.
 * Regions are never assumed adjacent: data flows between regions only
 * through copy constraints.
 */
template<typename F>
class SingleChipLayouter : public Layouter<F> {
public:
    explicit SingleChipLayouter(Assignment<F>& cs) : cs_(cs) {}

    void constrain_instance(const Cell& cell, InstanceColumn column, size_t row) override {
        cs_.copy(cell.column, absolute_row(cell), column.any(), row);
    }

    // Start row of every region laid out so far, by region index
    const std::vector<size_t>& region_starts() const { return regions_; }

protected:
    void assign_region_impl(const std::string& name,
                            const std::function<void(Region<F>&)>& body) override {
        const size_t region_index = regions_.size();
        RegionRecorder<F> recorder(region_index);
        Region<F> region(recorder);
        body(region);

        size_t start = 0;
        for (const auto& column : recorder.columns()) {
            auto it = columns_.find(column);
            if (it != columns_.end()) {
                start = std::max(start, it->second);
            }
        }
        const size_t rows = recorder.num_rows();
        if (start + rows > cs_.usable_rows()) {
            throw Error::not_enough_rows(cs_.k());
        }

        PLONKISH_DEBUG_PRINT("[layout] region %zu '%s' at row %zu (%zu rows, %zu columns)\n",
                             region_index, name.c_str(), start, rows, recorder.columns().size());

        // Cells of this region resolve against start; earlier ones against regions_
        auto resolve = [this, region_index, start](const Cell& cell) {
            return cell.region_index == region_index ? start + cell.row_offset : absolute_row(cell);
        };

        cs_.enter_region(name);
        try {
            for (const auto& a : recorder.advice()) {
                cs_.assign_advice(a.annotation, a.column, start + a.offset, a.value);
            }
            for (const auto& f : recorder.fixed()) {
                cs_.assign_fixed(f.annotation, f.column, start + f.offset, f.value);
            }
            for (const auto& eq : recorder.equalities()) {
                cs_.copy(eq.first.column, resolve(eq.first), eq.second.column, resolve(eq.second));
            }
        } catch (...) {
            cs_.abort_region();
            throw;
        }
        cs_.exit_region();

        regions_.push_back(start);
        for (const auto& column : recorder.columns()) {
            columns_[column] = start + rows;
        }
    }

private:
    size_t absolute_row(const Cell& cell) const {
        if (cell.region_index >= regions_.size()) {
            throw Error::synthesis("cell refers to region " + std::to_string(cell.region_index) +
                                   " which has not been laid out");
        }
        return regions_[cell.region_index] + cell.row_offset;
    }

    Assignment<F>& cs_;
    std::vector<size_t> regions_;
    std::map<AnyColumn, size_t> columns_;  // First free row per column
};

/**
 * SimpleFloorPlanner - Drives a circuit's synthesize() with a SingleChipLayouter
 *
 * A circuit type C used with a floor planner exposes:
 *   using Config;                       // column handles from configure()
 *   using FloorPlanner;                 // e.g. SimpleFloorPlanner
 *   C without_witnesses() const;        // same shape, unknown witness
 *   static Config configure(ConstraintSystem<F>&);
 *   void synthesize(const Config&, Layouter<F>&) const;
 */
struct SimpleFloorPlanner {
    template<typename F, typename C>
    static void synthesize(Assignment<F>& cs, const C& circuit, const typename C::Config& config) {
        SingleChipLayouter<F> layouter(cs);
        circuit.synthesize(config, layouter);
    }
};

} // namespace plonkish
