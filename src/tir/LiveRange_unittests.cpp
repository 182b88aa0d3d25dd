#include "tir/LiveRange.hpp"

#include "doctest/doctest.h"

namespace {

tir::ProgramPoint pt(uint32_t block, uint32_t index) { return tir::ProgramPoint(tir::Block(block), index); }

tir::Reg vreg(uint32_t id) { return tir::Reg::virt(tir::RegClass::integer(8), id); }

} // namespace

namespace tir {

TEST_CASE("ProgramPoint ordering") {
    CHECK(pt(0, 5) < pt(1, 0));
    CHECK(pt(1, 0) < pt(1, 1));
    CHECK(pt(1, 1) <= pt(1, 1));
    CHECK_FALSE(pt(2, 0) < pt(1, 9));
    CHECK(pt(2, 0) > pt(1, 9));
    CHECK_EQ(pt(1, 2), pt(1, 2));
    CHECK_NE(pt(1, 2), pt(2, 1));
    CHECK_EQ(pt(1, 2).toString(), "(block1, 2)");
}

TEST_CASE("LiveRange covers and overlaps") {
    LiveRange range(vreg(0), pt(0, 2), pt(1, 0));
    CHECK(range.covers(pt(0, 2)));
    CHECK(range.covers(pt(0, 7)));
    CHECK(range.covers(pt(1, 0)));
    CHECK_FALSE(range.covers(pt(0, 1)));
    CHECK_FALSE(range.covers(pt(1, 1)));

    // Ends are inclusive, so sharing a single point is an overlap.
    CHECK(range.overlaps(LiveRange(vreg(1), pt(1, 0), pt(1, 3))));
    CHECK(range.overlaps(LiveRange(vreg(1), pt(0, 0), pt(0, 2))));
    CHECK(range.overlaps(LiveRange(vreg(1), pt(0, 3), pt(0, 4))));
    CHECK_FALSE(range.overlaps(LiveRange(vreg(1), pt(1, 1), pt(1, 3))));
    CHECK_FALSE(range.overlaps(LiveRange(vreg(1), pt(0, 0), pt(0, 1))));
    CHECK_EQ(range.toString(), "[(block0, 2), (block1, 0)]");
}

TEST_CASE("LiveInterval addRange") {
    SUBCASE("Non-overlapping ranges") {
        LiveInterval lt(vreg(0));
        CHECK(lt.isEmpty());
        lt.addRange(pt(0, 4), pt(0, 5));
        REQUIRE_EQ(lt.ranges().size(), 1);
        lt.addRange(pt(0, 0), pt(0, 1));
        REQUIRE_EQ(lt.ranges().size(), 2);
        CHECK_EQ(lt.ranges().front().start, pt(0, 0));
        lt.addRange(pt(1, 0), pt(1, 2));
        lt.addRange(pt(0, 2), pt(0, 3));
        REQUIRE_EQ(lt.ranges().size(), 4);
        CHECK_EQ(lt.ranges()[0].end, pt(0, 1));
        CHECK_EQ(lt.ranges()[1].start, pt(0, 2));
        CHECK_EQ(lt.ranges()[1].end, pt(0, 3));
        CHECK_EQ(lt.ranges()[2].start, pt(0, 4));
        CHECK_EQ(lt.ranges()[3].end, pt(1, 2));
        CHECK_EQ(lt.start(), pt(0, 0));
        CHECK_EQ(lt.end(), pt(1, 2));
        for (const auto& range : lt.ranges()) {
            CHECK_EQ(range.reg, vreg(0));
        }
    }

    SUBCASE("Complete overlap expansion of range") {
        LiveInterval lt(vreg(0));
        lt.addRange(pt(0, 49), pt(0, 51));
        lt.addRange(pt(0, 47), pt(0, 53));
        REQUIRE_EQ(lt.ranges().size(), 1);
        CHECK_EQ(lt.start(), pt(0, 47));
        CHECK_EQ(lt.end(), pt(0, 53));
        lt.addRange(pt(0, 35), pt(0, 40));
        lt.addRange(pt(0, 55), pt(0, 60));
        lt.addRange(pt(0, 25), pt(0, 30));
        lt.addRange(pt(0, 75), pt(0, 80));
        CHECK_EQ(lt.ranges().size(), 5);
        lt.addRange(pt(0, 1), pt(0, 100));
        REQUIRE_EQ(lt.ranges().size(), 1);
        CHECK_EQ(lt.start(), pt(0, 1));
        CHECK_EQ(lt.end(), pt(0, 100));
        // Duplicate and contained additions change nothing.
        lt.addRange(pt(0, 1), pt(0, 100));
        lt.addRange(pt(0, 1), pt(0, 2));
        lt.addRange(pt(0, 99), pt(0, 100));
        lt.addRange(pt(0, 49), pt(0, 51));
        REQUIRE_EQ(lt.ranges().size(), 1);
        CHECK_EQ(lt.start(), pt(0, 1));
        CHECK_EQ(lt.end(), pt(0, 100));
    }

    SUBCASE("Shared end point merges") {
        LiveInterval lt(vreg(0));
        lt.addRange(pt(0, 5), pt(0, 7));
        lt.addRange(pt(0, 7), pt(0, 9));
        REQUIRE_EQ(lt.ranges().size(), 1);
        CHECK_EQ(lt.start(), pt(0, 5));
        CHECK_EQ(lt.end(), pt(0, 9));
    }

    SUBCASE("Bridging range absorbs neighbors") {
        LiveInterval lt(vreg(0));
        lt.addRange(pt(0, 0), pt(0, 2));
        lt.addRange(pt(0, 4), pt(0, 6));
        lt.addRange(pt(0, 8), pt(0, 10));
        lt.addRange(pt(0, 12), pt(0, 14));
        lt.addRange(pt(0, 2), pt(0, 8));
        REQUIRE_EQ(lt.ranges().size(), 2);
        CHECK_EQ(lt.ranges()[0].start, pt(0, 0));
        CHECK_EQ(lt.ranges()[0].end, pt(0, 10));
        CHECK_EQ(lt.ranges()[1].start, pt(0, 12));
    }

    SUBCASE("Left expansion") {
        LiveInterval lt(vreg(0));
        lt.addRange(pt(0, 10), pt(0, 15));
        lt.addRange(pt(0, 20), pt(0, 25));
        lt.addRange(pt(0, 17), pt(0, 21));
        REQUIRE_EQ(lt.ranges().size(), 2);
        CHECK_EQ(lt.ranges()[1].start, pt(0, 17));
        CHECK_EQ(lt.ranges()[1].end, pt(0, 25));
    }
}

TEST_CASE("LiveInterval coalesce") {
    LiveInterval lt(vreg(0));
    lt.addRange(pt(0, 0), pt(0, 3));
    lt.addRange(pt(1, 0), pt(1, 2));
    lt.addRange(pt(3, 0), pt(3, 1));
    REQUIRE_EQ(lt.ranges().size(), 3);

    SUBCASE("Nothing contiguous") {
        lt.coalesce([](const ProgramPoint&, const ProgramPoint&) { return false; });
        CHECK_EQ(lt.ranges().size(), 3);
    }

    SUBCASE("Block boundary") {
        lt.coalesce([](const ProgramPoint& end, const ProgramPoint& nextStart) {
            return end.index == 3 && nextStart.index == 0 && nextStart.block.index() == end.block.index() + 1;
        });
        REQUIRE_EQ(lt.ranges().size(), 2);
        CHECK_EQ(lt.ranges()[0].start, pt(0, 0));
        CHECK_EQ(lt.ranges()[0].end, pt(1, 2));
        CHECK_EQ(lt.ranges()[1].start, pt(3, 0));
    }
}

TEST_CASE("LiveInterval queries") {
    LiveInterval a(vreg(0));
    a.addRange(pt(0, 1), pt(0, 3));
    a.addRange(pt(0, 6), pt(0, 8));
    a.addRange(pt(1, 0), pt(1, 1));

    SUBCASE("covers") {
        CHECK_FALSE(a.covers(pt(0, 0)));
        CHECK(a.covers(pt(0, 1)));
        CHECK(a.covers(pt(0, 3)));
        CHECK_FALSE(a.covers(pt(0, 4)));
        CHECK(a.covers(pt(0, 7)));
        CHECK(a.covers(pt(1, 1)));
        CHECK_FALSE(a.covers(pt(1, 2)));
        CHECK_FALSE(a.covers(pt(2, 0)));
        CHECK_FALSE(LiveInterval(vreg(1)).covers(pt(0, 0)));
    }

    SUBCASE("intersects") {
        CHECK_FALSE(a.intersects(pt(0, 4), pt(0, 5)));
        CHECK(a.intersects(pt(0, 3), pt(0, 4)));
        CHECK(a.intersects(pt(0, 0), pt(2, 0)));
        CHECK_FALSE(a.intersects(pt(0, 9), pt(0, 20)));
        CHECK_FALSE(a.intersects(pt(0, 0), pt(0, 0)));
        CHECK_FALSE(a.intersects(pt(1, 2), pt(3, 0)));
    }
}

} // namespace tir
