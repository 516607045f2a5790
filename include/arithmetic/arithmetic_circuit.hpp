#pragma once

#include <tuple>
#include <utility>
#include "arithmetic/arithmetic_chip.hpp"
#include "arithmetic/arithmetic_config.hpp"
#include "circuit/floor_planner.hpp"
#include "circuit/layouter.hpp"
#include "circuit/value.hpp"
#include "plonk/constraint_system.hpp"

namespace plonkish {

/**
 * ArithmeticCircuit<F> - Proves knowledge of private x, y with
 *   x^2 * y^2 + constant = PI[0]
 *
 * Trace (one region per row, wired by copy constraints):
 *   0 mul       x   * x   = x^2      l == r
 *   1 mul       y   * y   = y^2      l == r
 *   2 mul       x^2 * y^2 = x^2y^2   l == out(0), r == out(1)
 *   3 constant  out = sc = constant
 *   4 add       x^2y^2 + constant    l == out(2), r == out(3)
 *   out(4) == PI[0]
 *
 * The constant is fixed by the shape, so keys derived for one constant
 * reject witnesses built for another.
 */
template<typename F>
class ArithmeticCircuit {
public:
    using Config = ArithmeticConfig;
    using FloorPlanner = SimpleFloorPlanner;

    // Unknown witness, zero constant
    ArithmeticCircuit() : constant_(F::zero()) {}

    ArithmeticCircuit(Value<F> x, Value<F> y, F constant)
        : x_(std::move(x)), y_(std::move(y)), constant_(std::move(constant)) {}

    // Same circuit, witness dropped; the constant belongs to the circuit and stays
    ArithmeticCircuit without_witnesses() const {
        return ArithmeticCircuit(Value<F>::unknown(), Value<F>::unknown(), constant_);
    }

    static Config configure(ConstraintSystem<F>& meta) {
        return ArithmeticConfig::configure(meta);
    }

    void synthesize(const Config& config, Layouter<F>& layouter) const {
        ArithmeticChip<F> chip(config);
        using A = Assigned<F>;

        const Value<A> x = x_.template into<A>();
        const Value<A> y = y_.template into<A>();
        const A constant(constant_);

        auto [a0, b0, c0] = chip.raw_multiply(layouter, [&x] {
            return x.map([](const A& v) { return std::make_tuple(v, v, v * v); });
        });
        chip.copy(layouter, a0, b0);

        auto [a1, b1, c1] = chip.raw_multiply(layouter, [&y] {
            return y.map([](const A& v) { return std::make_tuple(v, v, v * v); });
        });
        chip.copy(layouter, a1, b1);

        auto [a2, b2, c2] = chip.raw_multiply(layouter, [&x, &y] {
            return x.zip(y).map([](const std::pair<A, A>& xy) {
                A xx = xy.first * xy.first;
                A yy = xy.second * xy.second;
                return std::make_tuple(xx, yy, xx * yy);
            });
        });
        chip.copy(layouter, c0, a2);
        chip.copy(layouter, c1, b2);

        Cell k = chip.load_constant(layouter, constant_);

        auto [a3, b3, c3] = chip.raw_add(layouter, [&x, &y, &constant] {
            return x.zip(y).map([&constant](const std::pair<A, A>& xy) {
                A product = (xy.first * xy.first) * (xy.second * xy.second);
                return std::make_tuple(product, constant, product + constant);
            });
        });
        chip.copy(layouter, c2, a3);
        chip.copy(layouter, k, b3);

        chip.expose_public(layouter, c3, 0);
    }

    // The value PI[0] must hold for the witness (x, y)
    static F public_output(const F& x, const F& y, const F& constant) {
        return (x * x) * (y * y) + constant;
    }

    const Value<F>& x() const { return x_; }
    const Value<F>& y() const { return y_; }
    const F& constant() const { return constant_; }

private:
    Value<F> x_;
    Value<F> y_;
    F constant_;
};

} // namespace plonkish
