#pragma once

#include <vector>
#include "plonk/column.hpp"
#include "plonk/constraint_system.hpp"

namespace plonkish {

/**
 * ArithmeticConfig - Columns of the standard PLONK gate
 *
 * Advice:   l, r, o           (left, right, output operands; equality enabled)
 * Fixed:    sl, sr, so, sm, sc (left, right, output, multiplication, constant selectors)
 * Instance: pi                (public inputs; equality enabled)
 *
 * One gate, checked on every row with all queries at the current row:
 *   sl*l + sr*r + sm*(l*r) - so*o + sc = 0
 *
 * Multiplication rows set sm = so = 1, addition rows set sl = sr = so = 1;
 * every selector left unset is zero, which switches its term off.
 */
struct ArithmeticConfig {
    AdviceColumn l;
    AdviceColumn r;
    AdviceColumn o;

    FixedColumn sl;
    FixedColumn sr;
    FixedColumn so;
    FixedColumn sm;
    FixedColumn sc;

    InstanceColumn pi;

    template<typename F>
    static ArithmeticConfig configure(ConstraintSystem<F>& meta) {
        ArithmeticConfig config;

        config.l = meta.advice_column();
        config.r = meta.advice_column();
        config.o = meta.advice_column();

        meta.enable_equality(config.l);
        meta.enable_equality(config.r);
        meta.enable_equality(config.o);

        config.sm = meta.fixed_column();
        config.sl = meta.fixed_column();
        config.sr = meta.fixed_column();
        config.so = meta.fixed_column();
        config.sc = meta.fixed_column();

        config.pi = meta.instance_column();
        meta.enable_equality(config.pi);

        meta.annotate_column(config.l, "l");
        meta.annotate_column(config.r, "r");
        meta.annotate_column(config.o, "o");
        meta.annotate_column(config.sm, "sm");
        meta.annotate_column(config.sl, "sl");
        meta.annotate_column(config.sr, "sr");
        meta.annotate_column(config.so, "so");
        meta.annotate_column(config.sc, "sc");
        meta.annotate_column(config.pi, "PI");

        meta.create_gate("plonk", [&config](VirtualCells<F>& cells) {
            auto l = cells.query_advice(config.l, Rotation::cur());
            auto r = cells.query_advice(config.r, Rotation::cur());
            auto o = cells.query_advice(config.o, Rotation::cur());

            auto sl = cells.query_fixed(config.sl, Rotation::cur());
            auto sr = cells.query_fixed(config.sr, Rotation::cur());
            auto so = cells.query_fixed(config.so, Rotation::cur());
            auto sm = cells.query_fixed(config.sm, Rotation::cur());
            auto sc = cells.query_fixed(config.sc, Rotation::cur());

            return std::vector<Expression<F>>{
                sl * l + sr * r + sm * (l * r) - so * o + sc
            };
        });

        return config;
    }
};

} // namespace plonkish
