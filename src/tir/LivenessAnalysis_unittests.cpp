#include "tir/LivenessAnalysis.hpp"

#include "tir/ErrorReporter.hpp"
#include "tir/Function.hpp"
#include "tir/Validator.hpp"
#include "tir/x64/Inst.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace {

tir::ProgramPoint pt(tir::Block block, uint32_t index) { return tir::ProgramPoint(block, index); }

} // namespace

namespace tir {

using x64::Inst;

TEST_CASE("LivenessAnalysis straight line across blocks") {
    Function<Inst> function("straight", {}, {});
    auto v0 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    auto b2 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRR(v0, x64::gpr(x64::kRDI)));
    function.mutableBlockData(b0).push(Inst::jmp(b1));
    function.mutableBlockData(b1).push(Inst::movRR(x64::gpr(x64::kRAX), v0));
    function.mutableBlockData(b1).push(Inst::ret({x64::gpr(x64::kRAX)}));
    function.mutableBlockData(b2).push(Inst::ret());
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));
    CHECK(function.cfg().hasEdge(b0, b1));

    LivenessAnalysis liveness(function);
    CHECK_EQ(liveness.numberOfPhysicalRegisters(), x64::kNumberOfRegisters);
    CHECK_EQ(liveness.numberOfRegisters(), x64::kNumberOfRegisters + 1);
    auto v0Index = liveness.regIndex(v0);
    CHECK_EQ(v0Index, x64::kNumberOfRegisters);
    CHECK(liveness.isVirtual(v0Index));
    CHECK_FALSE(liveness.isVirtual(x64::kRDI));
    CHECK_EQ(liveness.reg(v0Index), v0);

    SUBCASE("block sets") {
        CHECK_EQ(liveness.uses(b0).ones(), std::vector<size_t>{x64::kRDI});
        CHECK_EQ(liveness.defs(b0).ones(), std::vector<size_t>{v0Index});
        // RAX is written before the return reads it, so it is not an upward exposed use.
        CHECK_EQ(liveness.uses(b1).ones(), std::vector<size_t>{v0Index});
        CHECK_EQ(liveness.defs(b1).ones(), std::vector<size_t>{x64::kRAX});
        CHECK_EQ(liveness.liveIn(b0).ones(), std::vector<size_t>{x64::kRDI});
        CHECK_EQ(liveness.liveOut(b0).ones(), std::vector<size_t>{v0Index});
        CHECK_EQ(liveness.liveIn(b1).ones(), std::vector<size_t>{v0Index});
        CHECK(liveness.liveOut(b1).empty());
        CHECK(liveness.liveIn(b2).empty());
        CHECK(liveness.liveOut(b2).empty());
    }

    SUBCASE("v0 has one range merged across the block boundary") {
        const auto& ranges = liveness.ranges(v0Index);
        REQUIRE_EQ(ranges.size(), 1);
        CHECK_EQ(ranges[0].reg, v0);
        CHECK_EQ(ranges[0].start, pt(b0, 0));
        CHECK_EQ(ranges[0].end, pt(b1, 0));
    }

    SUBCASE("physical registers get fixed ranges") {
        REQUIRE_EQ(liveness.ranges(x64::kRDI).size(), 1);
        CHECK_EQ(liveness.ranges(x64::kRDI)[0].start, pt(b0, 0));
        CHECK_EQ(liveness.ranges(x64::kRDI)[0].end, pt(b0, 0));
        REQUIRE_EQ(liveness.ranges(x64::kRAX).size(), 1);
        CHECK_EQ(liveness.ranges(x64::kRAX)[0].start, pt(b1, 0));
        CHECK_EQ(liveness.ranges(x64::kRAX)[0].end, pt(b1, 1));
        CHECK(liveness.ranges(x64::kRCX).empty());
    }

    SUBCASE("allRanges is ordered by start") {
        auto ranges = liveness.allRanges();
        REQUIRE_EQ(ranges.size(), 3);
        CHECK_EQ(ranges[0].reg, x64::physicalRegister(x64::kRDI));
        CHECK_EQ(ranges[1].reg, v0);
        CHECK_EQ(ranges[2].reg, x64::physicalRegister(x64::kRAX));
    }

    SUBCASE("validates") {
        CHECK(Validator::validateLiveness(liveness));
        CHECK(Validator::validateLiveRanges(liveness));
    }

    SUBCASE("generation") {
        CHECK(function.isCurrent(liveness.generation()));
        function.mutableBlockData(b2);
        CHECK_FALSE(function.isCurrent(liveness.generation()));
    }
}

TEST_CASE("LivenessAnalysis loop") {
    // block0 -> block1 -> block2 -> block0, with v0 and v1 live around the whole cycle.
    Function<Inst> function("loop", {RegClass::integer(8)}, {});
    auto v0 = function.argument(0);
    auto v1 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    auto b2 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRI(v1, 1));
    function.mutableBlockData(b0).push(Inst::add(v0, v1));
    function.mutableBlockData(b0).push(Inst::jmp(b1));
    function.mutableBlockData(b1).push(Inst::add(v0, v1));
    function.mutableBlockData(b1).push(Inst::jmp(b2));
    function.mutableBlockData(b2).push(Inst::cmp(v0, v1));
    function.mutableBlockData(b2).push(Inst::jmp(b0));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    auto v0Index = liveness.regIndex(v0);
    auto v1Index = liveness.regIndex(v1);

    CHECK_EQ(liveness.liveIn(b0).ones(), std::vector<size_t>{v0Index});
    CHECK_EQ(liveness.liveOut(b0).ones(), std::vector<size_t>{v0Index, v1Index});
    CHECK_EQ(liveness.liveIn(b1).ones(), std::vector<size_t>{v0Index, v1Index});
    CHECK_EQ(liveness.liveOut(b1).ones(), std::vector<size_t>{v0Index, v1Index});
    CHECK_EQ(liveness.liveIn(b2).ones(), std::vector<size_t>{v0Index, v1Index});
    // Only v0 flows around the back edge, v1 is redefined at the top of the loop.
    CHECK_EQ(liveness.liveOut(b2).ones(), std::vector<size_t>{v0Index});

    const auto& v0Ranges = liveness.ranges(v0Index);
    REQUIRE_EQ(v0Ranges.size(), 1);
    CHECK_EQ(v0Ranges[0].start, pt(b0, 0));
    CHECK_EQ(v0Ranges[0].end, pt(b2, 2));

    const auto& v1Ranges = liveness.ranges(v1Index);
    REQUIRE_EQ(v1Ranges.size(), 1);
    CHECK_EQ(v1Ranges[0].start, pt(b0, 0));
    CHECK_EQ(v1Ranges[0].end, pt(b2, 0));

    CHECK(Validator::validateLiveness(liveness));
    CHECK(Validator::validateLiveRanges(liveness));
}

TEST_CASE("LivenessAnalysis diamond") {
    Function<Inst> function("diamond", {RegClass::integer(8), RegClass::integer(8)}, {});
    auto v0 = function.argument(0);
    auto v1 = function.argument(1);
    auto v2 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    auto b2 = function.addEmptyBlock();
    auto b3 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::cmp(v0, v1));
    function.mutableBlockData(b0).push(Inst::jcc(x64::kLess, b1, b2));
    function.mutableBlockData(b1).push(Inst::movRR(v2, v0));
    function.mutableBlockData(b1).push(Inst::jmp(b3));
    function.mutableBlockData(b2).push(Inst::movRR(v2, v1));
    function.mutableBlockData(b2).push(Inst::jmp(b3));
    function.mutableBlockData(b3).push(Inst::ret({v2}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    auto v0Index = liveness.regIndex(v0);
    auto v1Index = liveness.regIndex(v1);
    auto v2Index = liveness.regIndex(v2);

    CHECK_EQ(liveness.liveIn(b0).ones(), std::vector<size_t>{v0Index, v1Index});
    CHECK_EQ(liveness.liveIn(b1).ones(), std::vector<size_t>{v0Index});
    CHECK_EQ(liveness.liveIn(b2).ones(), std::vector<size_t>{v1Index});
    CHECK_EQ(liveness.liveIn(b3).ones(), std::vector<size_t>{v2Index});

    SUBCASE("ranges only merge across real fall-through edges") {
        // block0 -> block1 is an edge between neighbors.
        REQUIRE_EQ(liveness.ranges(v0Index).size(), 1);
        CHECK_EQ(liveness.ranges(v0Index)[0].start, pt(b0, 0));
        CHECK_EQ(liveness.ranges(v0Index)[0].end, pt(b1, 0));

        // block1 is between block0 and block2, so v1 has a hole.
        REQUIRE_EQ(liveness.ranges(v1Index).size(), 2);
        CHECK_EQ(liveness.ranges(v1Index)[0].end, pt(b0, 2));
        CHECK_EQ(liveness.ranges(v1Index)[1].start, pt(b2, 0));
        CHECK_EQ(liveness.ranges(v1Index)[1].end, pt(b2, 0));

        // block1 and block2 are neighbors but there is no edge between them.
        REQUIRE_EQ(liveness.ranges(v2Index).size(), 2);
        CHECK_EQ(liveness.ranges(v2Index)[0].start, pt(b1, 0));
        CHECK_EQ(liveness.ranges(v2Index)[0].end, pt(b1, 2));
        CHECK_EQ(liveness.ranges(v2Index)[1].start, pt(b2, 0));
        CHECK_EQ(liveness.ranges(v2Index)[1].end, pt(b3, 0));
    }

    SUBCASE("isContiguous") {
        CHECK(liveness.isContiguous(pt(b0, 2), pt(b1, 0)));
        CHECK_FALSE(liveness.isContiguous(pt(b0, 1), pt(b1, 0)));
        CHECK_FALSE(liveness.isContiguous(pt(b0, 2), pt(b1, 1)));
        CHECK_FALSE(liveness.isContiguous(pt(b1, 2), pt(b2, 0)));
        CHECK(liveness.isContiguous(pt(b2, 2), pt(b3, 0)));
        CHECK_FALSE(liveness.isContiguous(pt(b0, 2), pt(b2, 0)));
    }

    CHECK(Validator::validateLiveness(liveness));
    CHECK(Validator::validateLiveRanges(liveness));
}

TEST_CASE("LivenessAnalysis fixed point") {
    // A nested loop forces the worklist to revisit blocks as liveness flows backward around both back edges.
    Function<Inst> function("nested", {RegClass::integer(8), RegClass::integer(8)}, {RegClass::integer(8)});
    auto a = function.argument(0);
    auto b = function.argument(1);
    auto result = function.result(0);
    auto t = function.newVReg(RegClass::integer(8));
    std::vector<Block> blocks;
    for (int i = 0; i < 6; ++i) {
        blocks.emplace_back(function.addEmptyBlock());
    }
    function.mutableBlockData(blocks[0]).push(Inst::movRI(t, 0));
    function.mutableBlockData(blocks[0]).push(Inst::jmp(blocks[1]));
    function.mutableBlockData(blocks[1]).push(Inst::add(t, a));
    function.mutableBlockData(blocks[1]).push(Inst::jmp(blocks[2]));
    function.mutableBlockData(blocks[2]).push(Inst::imul(t, b));
    function.mutableBlockData(blocks[2]).push(Inst::jmp(blocks[3]));
    function.mutableBlockData(blocks[3]).push(Inst::cmp(t, b));
    function.mutableBlockData(blocks[3]).push(Inst::jcc(x64::kLess, blocks[2], blocks[4]));
    function.mutableBlockData(blocks[4]).push(Inst::cmp(t, a));
    function.mutableBlockData(blocks[4]).push(Inst::jcc(x64::kLess, blocks[1], blocks[5]));
    function.mutableBlockData(blocks[5]).push(Inst::movRR(result, t));
    function.mutableBlockData(blocks[5]).push(Inst::ret({result}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    CHECK(Validator::validateLiveness(liveness));
    CHECK(Validator::validateLiveRanges(liveness));
    CHECK_GE(liveness.iterations(), blocks.size());

    auto aIndex = liveness.regIndex(a);
    auto bIndex = liveness.regIndex(b);
    auto tIndex = liveness.regIndex(t);
    // Both arguments are needed on every trip around the outer loop.
    for (size_t i = 0; i < 5; ++i) {
        CHECK(liveness.liveIn(blocks[i]).has(aIndex));
        CHECK(liveness.liveIn(blocks[i]).has(bIndex));
    }
    CHECK_FALSE(liveness.liveIn(blocks[5]).has(aIndex));
    CHECK_FALSE(liveness.liveIn(blocks[0]).has(tIndex));
    CHECK(liveness.liveOut(blocks[0]).has(tIndex));
    CHECK(liveness.liveOut(blocks[4]).has(tIndex));

    // Every block follows its layout predecessor along an edge, so the arguments are live in one unbroken range.
    REQUIRE_EQ(liveness.ranges(aIndex).size(), 1);
    CHECK_EQ(liveness.ranges(aIndex)[0].start, pt(blocks[0], 0));
    CHECK_EQ(liveness.ranges(aIndex)[0].end, pt(blocks[4], 2));

    SUBCASE("idempotent") {
        LivenessAnalysis again(function);
        for (auto block : function.blocks()) {
            CHECK_EQ(liveness.liveIn(block), again.liveIn(block));
            CHECK_EQ(liveness.liveOut(block), again.liveOut(block));
            CHECK_EQ(liveness.uses(block), again.uses(block));
            CHECK_EQ(liveness.defs(block), again.defs(block));
        }
        for (uint32_t i = 0; i < liveness.numberOfRegisters(); ++i) {
            CHECK_EQ(liveness.ranges(i), again.ranges(i));
        }
    }

    SUBCASE("coverage and disjointness") {
        for (auto block : function.blocks()) {
            for (auto reg : liveness.liveIn(block).ones()) {
                CHECK(liveness.interval(static_cast<uint32_t>(reg)).covers(pt(block, 0)));
            }
            for (auto reg : liveness.liveOut(block).ones()) {
                CHECK(liveness.interval(static_cast<uint32_t>(reg)).covers(pt(block, liveness.blockLength(block))));
            }
        }
        for (uint32_t i = 0; i < liveness.numberOfRegisters(); ++i) {
            const auto& ranges = liveness.ranges(i);
            for (size_t j = 1; j < ranges.size(); ++j) {
                CHECK_FALSE(ranges[j - 1].overlaps(ranges[j]));
            }
        }
    }
}

TEST_CASE("LivenessAnalysis unreachable block") {
    Function<Inst> function("unreachable", {RegClass::integer(8)}, {});
    auto v0 = function.argument(0);
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::ret());
    function.mutableBlockData(b1).push(Inst::ret({v0}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    auto v0Index = liveness.regIndex(v0);
    CHECK(liveness.liveIn(b1).has(v0Index));
    CHECK_FALSE(liveness.liveIn(b0).has(v0Index));
    REQUIRE_EQ(liveness.ranges(v0Index).size(), 1);
    CHECK_EQ(liveness.ranges(v0Index)[0].start, pt(b1, 0));
    CHECK(Validator::validateLiveness(liveness));
}

TEST_CASE("LivenessAnalysis dead def and redefinition") {
    Function<Inst> function("redefine", {}, {});
    auto v0 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRI(v0, 1));
    function.mutableBlockData(b0).push(Inst::movRI(v0, 2));
    function.mutableBlockData(b0).push(Inst::ret({v0}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    const auto& ranges = liveness.ranges(liveness.regIndex(v0));
    REQUIRE_EQ(ranges.size(), 2);
    CHECK_EQ(ranges[0].start, pt(b0, 0));
    CHECK_EQ(ranges[0].end, pt(b0, 0));
    CHECK_EQ(ranges[1].start, pt(b0, 1));
    CHECK_EQ(ranges[1].end, pt(b0, 2));
    CHECK(liveness.liveIn(b0).empty());
}

TEST_CASE("LivenessAnalysis toString") {
    Function<Inst> function("print", {RegClass::integer(8)}, {});
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::ret({function.argument(0)}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));
    LivenessAnalysis liveness(function);
    CHECK_EQ(liveness.toString<Inst>(), "block0: in {v0} out {}\nv0: [(block0, 0), (block0, 0)]\n");
}

} // namespace tir
