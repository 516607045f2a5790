#include <gtest/gtest.h>
#include <stdexcept>
#include "arithmetic/arithmetic_config.hpp"
#include "circuit/floor_planner.hpp"
#include "plonk/keygen.hpp"
#include "types/b_field_element.hpp"

using namespace plonkish;

class FloorPlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = ArithmeticConfig::configure(cs);
    }

    static Value<BFE> one() { return Value<BFE>::known(BFE::one()); }
    static Value<BFE> unknown() { return Value<BFE>::unknown(); }

    ConstraintSystem<BFE> cs;
    ArithmeticConfig config;
};

TEST_F(FloorPlannerTest, RegionsSharingColumnsAreStacked) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    for (int i = 0; i < 3; ++i) {
        layouter.assign_region("row", [&](Region<BFE>& region) {
            region.assign_advice("a", config.l, 0, unknown);
            region.assign_fixed("s", config.sm, 0, one);
        });
    }

    ASSERT_EQ(layouter.region_starts().size(), 3u);
    EXPECT_EQ(layouter.region_starts()[0], 0u);
    EXPECT_EQ(layouter.region_starts()[1], 1u);
    EXPECT_EQ(layouter.region_starts()[2], 2u);
    EXPECT_EQ(assembly.fixed()[config.sm.index][2], BFE::one());
}

TEST_F(FloorPlannerTest, RegionsOnDisjointColumnsShareRows) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    layouter.assign_region("left", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, unknown);
        region.assign_advice("a", config.l, 1, unknown);
    });
    layouter.assign_region("right", [&](Region<BFE>& region) {
        region.assign_advice("b", config.r, 0, unknown);
    });

    EXPECT_EQ(layouter.region_starts()[0], 0u);
    EXPECT_EQ(layouter.region_starts()[1], 0u);
}

TEST_F(FloorPlannerTest, MultiRowRegionPushesNextStart) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    layouter.assign_region("tall", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 2, unknown);
    });
    layouter.assign_region("next", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, unknown);
    });

    EXPECT_EQ(layouter.region_starts()[1], 3u);
    ASSERT_EQ(assembly.regions().size(), 2u);
    EXPECT_EQ(assembly.regions()[0].rows, std::make_pair(size_t(2), size_t(2)));
    EXPECT_EQ(assembly.regions()[1].rows, std::make_pair(size_t(3), size_t(3)));
}

TEST_F(FloorPlannerTest, AssignRegionReturnsBodyResult) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    layouter.assign_region("first", [&](Region<BFE>& region) {
        region.assign_advice("a", config.o, 0, unknown);
    });
    Cell cell = layouter.assign_region("second", [&](Region<BFE>& region) {
        return region.assign_advice("a", config.o, 0, unknown).cell;
    });

    EXPECT_EQ(cell.region_index, 1u);
    EXPECT_EQ(cell.row_offset, 0u);
    EXPECT_EQ(cell.column, config.o.any());
}

TEST_F(FloorPlannerTest, ValueClosureInvokedOnce) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    int calls = 0;
    layouter.assign_region("once", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, [&calls] {
            ++calls;
            return Value<BFE>::known(BFE(4));
        });
    });
    EXPECT_EQ(calls, 1);
}

TEST_F(FloorPlannerTest, CopyResolvesAbsoluteRows) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    Cell first = layouter.assign_region("r0", [&](Region<BFE>& region) {
        return region.assign_advice("a", config.o, 0, unknown).cell;
    });
    Cell second = layouter.assign_region("r1", [&](Region<BFE>& region) {
        return region.assign_advice("a", config.o, 0, unknown).cell;
    });
    layouter.assign_region("copy", [&](Region<BFE>& region) {
        region.constrain_equal(first, second);
    });
    layouter.constrain_instance(second, config.pi, 0);

    const auto& perm = assembly.permutation();
    EXPECT_TRUE(perm.in_same_cycle(config.o, 0, config.o, 1));
    EXPECT_TRUE(perm.in_same_cycle(config.o, 0, config.pi, 0));

    // The copy-only region occupies no rows
    EXPECT_FALSE(assembly.regions()[2].rows.has_value());
}

TEST_F(FloorPlannerTest, NotEnoughRows) {
    keygen::Assembly<BFE> assembly(1, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    layouter.assign_region("r0", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, unknown);
    });
    layouter.assign_region("r1", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, unknown);
    });
    try {
        layouter.assign_region("r2", [&](Region<BFE>& region) {
            region.assign_advice("a", config.l, 0, unknown);
        });
        FAIL() << "expected NotEnoughRowsAvailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotEnoughRowsAvailable);
    }
    EXPECT_EQ(assembly.regions().size(), 2u);
}

TEST_F(FloorPlannerTest, ThrowingBodyReplaysNothing) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    EXPECT_THROW(layouter.assign_region("broken", [&](Region<BFE>& region) {
        region.assign_fixed("s", config.sm, 0, one);
        throw std::runtime_error("witness generator failed");
    }), std::runtime_error);

    EXPECT_TRUE(assembly.regions().empty());
    EXPECT_TRUE(layouter.region_starts().empty());
    EXPECT_EQ(assembly.fixed()[config.sm.index][0], BFE::zero());
}

TEST_F(FloorPlannerTest, CellFromUnplacedRegionRejected) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    Cell dangling{5, 0, config.l.any()};
    try {
        layouter.constrain_instance(dangling, config.pi, 0);
        FAIL() << "expected a synthesis error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Synthesis);
    }
}

TEST_F(FloorPlannerTest, FailedReplayLeavesNoPlacement) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    // sm has no equality, so the copy fails after the cells were replayed
    try {
        layouter.assign_region("bad copy", [&](Region<BFE>& region) {
            auto a = region.assign_advice("a", config.l, 0, unknown);
            auto s = region.assign_fixed("s", config.sm, 0, one);
            region.constrain_equal(a.cell, s.cell);
        });
        FAIL() << "expected ColumnNotInPermutation";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ColumnNotInPermutation);
    }
    EXPECT_TRUE(layouter.region_starts().empty());
    EXPECT_TRUE(assembly.regions().empty());

    // The backend is not left inside the failed region, and its rows are free
    layouter.assign_region("next", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, unknown);
    });
    ASSERT_EQ(layouter.region_starts().size(), 1u);
    EXPECT_EQ(layouter.region_starts()[0], 0u);
    ASSERT_EQ(assembly.regions().size(), 1u);
    EXPECT_EQ(assembly.regions()[0].name, "next");
}

TEST_F(FloorPlannerTest, EqualityInsideOneRegion) {
    keygen::Assembly<BFE> assembly(3, cs);
    SingleChipLayouter<BFE> layouter(assembly);

    layouter.assign_region("first", [&](Region<BFE>& region) {
        region.assign_advice("a", config.l, 0, unknown);
    });
    layouter.assign_region("square", [&](Region<BFE>& region) {
        auto a = region.assign_advice("a", config.l, 0, unknown);
        auto b = region.assign_advice("b", config.r, 0, unknown);
        region.constrain_equal(a.cell, b.cell);
    });

    EXPECT_TRUE(assembly.permutation().in_same_cycle(config.l, 1, config.r, 1));
    EXPECT_FALSE(assembly.permutation().in_same_cycle(config.l, 0, config.r, 0));
}
