#include <gtest/gtest.h>
#include <memory>
#include <tuple>
#include "arithmetic/arithmetic_chip.hpp"
#include "circuit/floor_planner.hpp"
#include "plonk/keygen.hpp"
#include "types/b_field_element.hpp"

using namespace plonkish;

class ArithmeticChipTest : public ::testing::Test {
protected:
    using Chip = ArithmeticChip<BFE>;
    using Triple = Chip::Triple;

    void SetUp() override {
        config = ArithmeticConfig::configure(cs);
        assembly = std::make_unique<keygen::Assembly<BFE>>(3, cs);
        layouter = std::make_unique<SingleChipLayouter<BFE>>(*assembly);
    }

    static Value<Triple> triple(uint64_t a, uint64_t b, uint64_t c) {
        return Value<Triple>::known(std::make_tuple(Assigned<BFE>(BFE(a)),
                                                    Assigned<BFE>(BFE(b)),
                                                    Assigned<BFE>(BFE(c))));
    }

    BFE fixed_at(FixedColumn column, size_t row) const {
        return assembly->fixed()[column.index][row];
    }

    ConstraintSystem<BFE> cs;
    ArithmeticConfig config;
    std::unique_ptr<keygen::Assembly<BFE>> assembly;
    std::unique_ptr<SingleChipLayouter<BFE>> layouter;
};

TEST_F(ArithmeticChipTest, MultiplyOccupiesOneRow) {
    Chip chip(config);
    auto [a, b, c] = chip.raw_multiply(*layouter, [] { return triple(2, 3, 6); });

    EXPECT_EQ(a.column, config.l.any());
    EXPECT_EQ(b.column, config.r.any());
    EXPECT_EQ(c.column, config.o.any());
    EXPECT_EQ(a.row_offset, 0u);
    EXPECT_EQ(a.region_index, c.region_index);

    ASSERT_EQ(assembly->regions().size(), 1u);
    EXPECT_EQ(assembly->regions()[0].name, "mul");
    EXPECT_EQ(assembly->regions()[0].num_rows(), 1u);
}

TEST_F(ArithmeticChipTest, MultiplySelectors) {
    Chip chip(config);
    chip.raw_multiply(*layouter, [] { return triple(2, 3, 6); });

    EXPECT_EQ(fixed_at(config.sm, 0), BFE::one());
    EXPECT_EQ(fixed_at(config.so, 0), BFE::one());
    EXPECT_EQ(fixed_at(config.sl, 0), BFE::zero());
    EXPECT_EQ(fixed_at(config.sr, 0), BFE::zero());
    EXPECT_EQ(fixed_at(config.sc, 0), BFE::zero());
}

TEST_F(ArithmeticChipTest, AddSelectors) {
    Chip chip(config);
    chip.raw_add(*layouter, [] { return triple(1, 2, 3); });

    EXPECT_EQ(assembly->regions()[0].name, "add");
    EXPECT_EQ(fixed_at(config.sl, 0), BFE::one());
    EXPECT_EQ(fixed_at(config.sr, 0), BFE::one());
    EXPECT_EQ(fixed_at(config.so, 0), BFE::one());
    EXPECT_EQ(fixed_at(config.sm, 0), BFE::zero());
    EXPECT_EQ(fixed_at(config.sc, 0), BFE::zero());
}

TEST_F(ArithmeticChipTest, LoadConstantPinsSelector) {
    Chip chip(config);
    chip.raw_multiply(*layouter, [] { return triple(2, 2, 4); });
    Cell k = chip.load_constant(*layouter, BFE(5));

    EXPECT_EQ(k.column, config.o.any());
    EXPECT_EQ(k.row_offset, 0u);
    ASSERT_EQ(assembly->regions().size(), 2u);
    EXPECT_EQ(assembly->regions()[1].name, "constant");
    EXPECT_EQ(layouter->region_starts(), (std::vector<size_t>{0, 1}));

    EXPECT_EQ(fixed_at(config.sc, 1), BFE(5));
    EXPECT_EQ(fixed_at(config.so, 1), BFE::one());
    EXPECT_EQ(fixed_at(config.sm, 1), BFE::zero());
    EXPECT_EQ(fixed_at(config.sl, 1), BFE::zero());
    EXPECT_EQ(fixed_at(config.sr, 1), BFE::zero());
}

TEST_F(ArithmeticChipTest, LoadConstantCellIsCopyable) {
    Chip chip(config);
    Cell k = chip.load_constant(*layouter, BFE(7));
    auto cells = chip.raw_add(*layouter, [] { return triple(1, 7, 8); });
    chip.copy(*layouter, k, std::get<1>(cells));

    EXPECT_TRUE(assembly->permutation().in_same_cycle(config.o, 0, config.r, 1));
}

TEST_F(ArithmeticChipTest, SuccessiveCallsUseFreshRows) {
    Chip chip(config);
    auto first = chip.raw_multiply(*layouter, [] { return triple(2, 2, 4); });
    auto second = chip.raw_add(*layouter, [] { return triple(4, 1, 5); });

    EXPECT_NE(std::get<0>(first).region_index, std::get<0>(second).region_index);
    EXPECT_EQ(layouter->region_starts(), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(fixed_at(config.sm, 1), BFE::zero());
    EXPECT_EQ(fixed_at(config.sl, 1), BFE::one());
}

TEST_F(ArithmeticChipTest, UnknownTripleStillLaysOut) {
    Chip chip(config);
    chip.raw_multiply(*layouter, [] { return Value<Triple>::unknown(); });

    EXPECT_EQ(assembly->regions().size(), 1u);
    EXPECT_EQ(fixed_at(config.sm, 0), BFE::one());
}

TEST_F(ArithmeticChipTest, TripleProducerCalledOnce) {
    Chip chip(config);
    int calls = 0;
    chip.raw_add(*layouter, [&calls] {
        ++calls;
        return triple(1, 1, 2);
    });
    EXPECT_EQ(calls, 1);
}

TEST_F(ArithmeticChipTest, CopyIsRecordedBothWays) {
    Chip chip(config);
    auto [a0, b0, c0] = chip.raw_multiply(*layouter, [] { return triple(3, 3, 9); });
    chip.copy(*layouter, a0, b0);

    const auto& perm = assembly->permutation();
    EXPECT_TRUE(perm.in_same_cycle(config.l, 0, config.r, 0));
    EXPECT_TRUE(perm.in_same_cycle(config.r, 0, config.l, 0));
    EXPECT_FALSE(perm.in_same_cycle(config.l, 0, config.o, 0));
    (void)c0;

    ASSERT_EQ(assembly->regions().size(), 2u);
    EXPECT_EQ(assembly->regions()[1].name, "copy");
    EXPECT_EQ(assembly->regions()[1].num_rows(), 0u);
}

TEST_F(ArithmeticChipTest, ExposePublicAddsNoRegion) {
    Chip chip(config);
    auto cells = chip.raw_add(*layouter, [] { return triple(1, 2, 3); });
    chip.expose_public(*layouter, std::get<2>(cells), 2);

    EXPECT_EQ(assembly->regions().size(), 1u);
    EXPECT_TRUE(assembly->permutation().in_same_cycle(config.o, 0, config.pi, 2));
}

TEST_F(ArithmeticChipTest, ExposePublicOutOfRange) {
    Chip chip(config);
    auto cells = chip.raw_add(*layouter, [] { return triple(1, 2, 3); });
    try {
        chip.expose_public(*layouter, std::get<2>(cells), 8);
        FAIL() << "expected BoundsFailure";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BoundsFailure);
    }
}

TEST_F(ArithmeticChipTest, ThroughInstructionsInterface) {
    Chip chip(config);
    const ArithmeticInstructions<BFE>& instructions = chip;
    auto [a, b, c] = instructions.raw_multiply(*layouter, [] { return triple(2, 5, 10); });
    instructions.copy(*layouter, a, b);
    (void)c;
    EXPECT_EQ(assembly->permutation().num_copies(), 1u);
}
