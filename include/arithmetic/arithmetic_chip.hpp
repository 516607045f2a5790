#pragma once

#include <functional>
#include <tuple>
#include "arithmetic/arithmetic_config.hpp"
#include "circuit/assigned.hpp"
#include "circuit/cell.hpp"
#include "circuit/layouter.hpp"
#include "circuit/value.hpp"

namespace plonkish {

/**
 * ArithmeticInstructions<F> - Row-level primitives of the standard PLONK gate
 *
 * The triple producers are invoked once, when their region is assigned. The
 * triples are not checked here: a triple that breaks its relation yields a
 * witness the gate check rejects.
 */
template<typename F>
class ArithmeticInstructions {
public:
    using Triple = std::tuple<Assigned<F>, Assigned<F>, Assigned<F>>;
    using TripleFn = std::function<Value<Triple>()>;
    using Cells = std::tuple<Cell, Cell, Cell>;

    virtual ~ArithmeticInstructions() = default;

    // One "mul" region holding (a, b, c) with a * b = c expected
    virtual Cells raw_multiply(Layouter<F>& layouter, const TripleFn& f) const = 0;

    // One "add" region holding (a, b, c) with a + b = c expected
    virtual Cells raw_add(Layouter<F>& layouter, const TripleFn& f) const = 0;

    /**
     * One "constant" region whose output cell is pinned to constant by the
     * fixed column sc (so = 1, sc = constant: the row reads o = constant).
     * The value becomes part of the circuit shape.
     */
    virtual Cell load_constant(Layouter<F>& layouter, const F& constant) const = 0;

    // Copy constraint a == b; both columns need equality enabled
    virtual void copy(Layouter<F>& layouter, const Cell& a, const Cell& b) const = 0;

    // Bind cell to row `row` of the public input column
    virtual void expose_public(Layouter<F>& layouter, const Cell& cell, size_t row) const = 0;
};

/**
 * ArithmeticChip<F> - The only component that writes cells
 */
template<typename F>
class ArithmeticChip : public ArithmeticInstructions<F> {
public:
    using typename ArithmeticInstructions<F>::Triple;
    using typename ArithmeticInstructions<F>::TripleFn;
    using typename ArithmeticInstructions<F>::Cells;

    explicit ArithmeticChip(ArithmeticConfig config) : config_(config) {}

    const ArithmeticConfig& config() const { return config_; }

    Cells raw_multiply(Layouter<F>& layouter, const TripleFn& f) const override {
        return layouter.assign_region("mul", [this, &f](Region<F>& region) {
            Cells cells = assign_operands(region, f());
            region.assign_fixed("m", config_.sm, 0, [] { return Value<F>::known(F::one()); });
            region.assign_fixed("o", config_.so, 0, [] { return Value<F>::known(F::one()); });
            return cells;
        });
    }

    Cells raw_add(Layouter<F>& layouter, const TripleFn& f) const override {
        return layouter.assign_region("add", [this, &f](Region<F>& region) {
            Cells cells = assign_operands(region, f());
            region.assign_fixed("l", config_.sl, 0, [] { return Value<F>::known(F::one()); });
            region.assign_fixed("r", config_.sr, 0, [] { return Value<F>::known(F::one()); });
            region.assign_fixed("o", config_.so, 0, [] { return Value<F>::known(F::one()); });
            return cells;
        });
    }

    Cell load_constant(Layouter<F>& layouter, const F& constant) const override {
        return layouter.assign_region("constant", [this, &constant](Region<F>& region) {
            // l and r are unused but every advice cell the gate reads must be assigned
            region.assign_advice("unused", config_.l, 0, [] { return Value<F>::known(F::zero()); });
            region.assign_advice("unused", config_.r, 0, [] { return Value<F>::known(F::zero()); });
            auto out = region.assign_advice("constant", config_.o, 0,
                                            [&constant] { return Value<F>::known(constant); });
            region.assign_fixed("o", config_.so, 0, [] { return Value<F>::known(F::one()); });
            region.assign_fixed("c", config_.sc, 0, [&constant] { return Value<F>::known(constant); });
            return out.cell;
        });
    }

    void copy(Layouter<F>& layouter, const Cell& a, const Cell& b) const override {
        layouter.assign_region("copy", [&a, &b](Region<F>& region) {
            region.constrain_equal(a, b);
        });
    }

    void expose_public(Layouter<F>& layouter, const Cell& cell, size_t row) const override {
        layouter.constrain_instance(cell, config_.pi, row);
    }

private:
    // a -> l, b -> r, c -> o, all at offset 0
    Cells assign_operands(Region<F>& region, const Value<Triple>& values) const {
        auto lhs = region.assign_advice("lhs", config_.l, 0, [&values] {
            return values.map([](const Triple& t) { return std::get<0>(t); });
        });
        auto rhs = region.assign_advice("rhs", config_.r, 0, [&values] {
            return values.map([](const Triple& t) { return std::get<1>(t); });
        });
        auto out = region.assign_advice("out", config_.o, 0, [&values] {
            return values.map([](const Triple& t) { return std::get<2>(t); });
        });
        return Cells{lhs.cell, rhs.cell, out.cell};
    }

    ArithmeticConfig config_;
};

} // namespace plonkish
