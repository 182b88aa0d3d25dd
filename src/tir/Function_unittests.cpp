#include "tir/Function.hpp"

#include "tir/ErrorReporter.hpp"
#include "tir/x64/Inst.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace tir {

using x64::Inst;

TEST_CASE("Function registers") {
    Function<Inst> function("regs", {RegClass::integer(8), RegClass::vector(16)}, {RegClass::integer(4)});
    CHECK_EQ(function.name(), "regs");
    REQUIRE_EQ(function.arguments().size(), 2);
    REQUIRE_EQ(function.results().size(), 1);
    CHECK_EQ(function.argument(0), Reg::virt(RegClass::integer(8), 0));
    CHECK_EQ(function.argument(1), Reg::virt(RegClass::vector(16), 1));
    CHECK_EQ(function.result(0), Reg::virt(RegClass::integer(4), 2));
    CHECK_EQ(function.numberOfVRegs(), 3);

    auto v3 = function.newVReg(RegClass::floating(8));
    CHECK_EQ(v3.id(), 3);
    CHECK_EQ(function.vRegClass(3), RegClass::floating(8));
    CHECK_EQ(function.numberOfRegisters(), x64::kNumberOfRegisters + 4);
}

TEST_CASE("Function blocks") {
    Function<Inst> function("blocks", {}, {});
    CHECK(function.entryBlock().isNone());
    CHECK_EQ(function.numberOfBlocks(), 0);

    auto b0 = function.addEmptyBlock();
    BlockData<Inst> data;
    data.push(Inst::ret());
    auto b1 = function.addBlock(std::move(data));
    CHECK_EQ(function.entryBlock(), b0);
    CHECK_EQ(function.blocks(), std::vector<Block>{b0, b1});
    CHECK_EQ(function.blockCapacity(), 2);
    CHECK(function.blockData(b0).empty());
    CHECK(function.blockData(b1).isTerminated());
    CHECK_EQ(function.blockData(b1).last()->opcode, x64::kRet);
}

TEST_CASE("Function generation") {
    Function<Inst> function("gen", {}, {});
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::ret());
    auto generation = function.generation();
    CHECK(function.isCurrent(generation));

    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));
    CHECK(function.hasCFG());
    CHECK_FALSE(function.hasDominatorTree());
    const auto& domTree = function.constructDominatorTree();
    CHECK(function.hasDominatorTree());
    CHECK_EQ(&domTree, &function.dominatorTree());
    // Building analyses does not change the function.
    CHECK(function.isCurrent(generation));

    SUBCASE("reading leaves the caches valid") {
        CHECK(function.blockData(b0).isTerminated());
        CHECK(function.hasCFG());
        CHECK(function.hasDominatorTree());
    }

    SUBCASE("mutable access invalidates") {
        function.mutableBlockData(b0);
        CHECK_FALSE(function.isCurrent(generation));
        CHECK_GT(function.generation(), generation);
        CHECK_FALSE(function.hasCFG());
        CHECK_FALSE(function.hasDominatorTree());
    }

    SUBCASE("adding a block invalidates") {
        function.addEmptyBlock();
        CHECK_FALSE(function.isCurrent(generation));
        CHECK_FALSE(function.hasCFG());
    }
}

TEST_CASE("Function toString") {
    Function<Inst> function("max", {RegClass::integer(8), RegClass::integer(8)}, {RegClass::integer(8)});
    auto v0 = function.argument(0);
    auto v1 = function.argument(1);
    auto v2 = function.result(0);
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    auto b2 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRR(v2, v0));
    function.mutableBlockData(b0).push(Inst::cmp(v0, v1));
    function.mutableBlockData(b0).push(Inst::jcc(x64::kGreaterEqual, b2, b1));
    function.mutableBlockData(b1).push(Inst::movRR(v2, v1));
    function.mutableBlockData(b1).push(Inst::jmp(b2));
    function.mutableBlockData(b2).push(Inst::ret({v2}));

    const char* listing = "function max(v0, v1) -> (v2)\n"
                          "block0:\n"
                          "    mov v2, v0\n"
                          "    cmp v0, v1\n"
                          "    jge block2, block1\n"
                          "block1:\n"
                          "    mov v2, v1\n"
                          "    jmp block2\n"
                          "block2:\n"
                          "    ret v2\n";
    CHECK_EQ(function.toString(), listing);
    // Without a CFG there is nothing to annotate.
    CHECK_EQ(function.toString(true), listing);

    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));
    CHECK_EQ(function.toString(true),
             "function max(v0, v1) -> (v2)\n"
             "block0:  ; preds: succs: block2 block1\n"
             "    mov v2, v0\n"
             "    cmp v0, v1\n"
             "    jge block2, block1\n"
             "block1:  ; preds: block0 succs: block2\n"
             "    mov v2, v1\n"
             "    jmp block2\n"
             "block2:  ; preds: block0 block1 succs:\n"
             "    ret v2\n");
}

} // namespace tir
