#include "tir/CFG.hpp"

#include "tir/CFGBuilder.hpp"
#include "tir/ErrorReporter.hpp"
#include "tir/Function.hpp"
#include "tir/Validator.hpp"
#include "tir/x64/Inst.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace tir {

using x64::Inst;

TEST_CASE("CFG edges") {
    CFG cfg(Block(0), 4);
    CHECK_EQ(cfg.entry(), Block(0));
    CHECK_EQ(cfg.numberOfBlocks(), 4);
    CHECK_EQ(cfg.numberOfEdges(), 0);

    cfg.addEdge(Block(1), Block(0));
    cfg.addEdge(Block(2), Block(0));
    cfg.addEdge(Block(3), Block(1));
    cfg.addEdge(Block(3), Block(2));
    CHECK_EQ(cfg.numberOfEdges(), 4);

    CHECK_EQ(cfg.successors(Block(0)), std::vector<Block>{Block(1), Block(2)});
    CHECK_EQ(cfg.predecessors(Block(3)), std::vector<Block>{Block(1), Block(2)});
    CHECK(cfg.predecessors(Block(0)).empty());
    CHECK(cfg.successors(Block(3)).empty());
    CHECK(cfg.hasEdge(Block(0), Block(1)));
    CHECK_FALSE(cfg.hasEdge(Block(1), Block(0)));
    CHECK_FALSE(cfg.hasEdge(Block(1), Block(2)));

    CHECK(Validator::validateCFG(cfg));
}

TEST_CASE("CFG construction") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("empty function body") {
        Function<Inst> function("empty", {}, {});
        CHECK_FALSE(function.constructCFG(errorReporter));
        CHECK_FALSE(function.hasCFG());
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->lastError().code, kEmptyFunctionBody);
        CHECK(errorReporter->lastError().block.isNone());
    }

    SUBCASE("block not terminated") {
        Function<Inst> function("open", {}, {});
        auto b0 = function.addEmptyBlock();
        auto b1 = function.addEmptyBlock();
        auto b2 = function.addEmptyBlock();
        function.mutableBlockData(b0).push(Inst::jmp(b1));
        function.mutableBlockData(b1).push(Inst::movRI(x64::gpr(x64::kRAX), 1));
        function.mutableBlockData(b2).push(Inst::ret());
        CHECK_FALSE(function.constructCFG(errorReporter));
        CHECK_FALSE(function.hasCFG());
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->lastError().code, kBlockNotTerminated);
        CHECK_EQ(errorReporter->lastError().block, b1);
    }

    SUBCASE("empty block is not terminated") {
        Function<Inst> function("hollow", {}, {});
        auto b0 = function.addEmptyBlock();
        CHECK_FALSE(function.constructCFG(errorReporter));
        CHECK_EQ(errorReporter->lastError().block, b0);
    }

    SUBCASE("failure leaves no cached graph") {
        Function<Inst> function("rebuild", {}, {});
        auto b0 = function.addEmptyBlock();
        function.mutableBlockData(b0).push(Inst::ret());
        REQUIRE(function.constructCFG(errorReporter));
        REQUIRE(function.hasCFG());

        auto b1 = function.addEmptyBlock();
        CHECK_FALSE(function.hasCFG());
        CHECK_FALSE(function.constructCFG(errorReporter));
        CHECK_FALSE(function.hasCFG());

        function.mutableBlockData(b1).push(Inst::ret());
        CHECK(function.constructCFG(errorReporter));
        CHECK(function.hasCFG());
    }

    SUBCASE("branches add edges in both directions") {
        Function<Inst> function("branches", {RegClass::integer(8)}, {});
        auto v0 = function.argument(0);
        auto b0 = function.addEmptyBlock();
        auto b1 = function.addEmptyBlock();
        auto b2 = function.addEmptyBlock();
        auto b3 = function.addEmptyBlock();
        function.mutableBlockData(b0).push(Inst::cmp(v0, v0));
        function.mutableBlockData(b0).push(Inst::jcc(x64::kEqual, b1, b2));
        function.mutableBlockData(b1).push(Inst::jmp(b3));
        // Both targets the same block contribute a single edge.
        function.mutableBlockData(b2).push(Inst::jcc(x64::kGreater, b3, b3));
        function.mutableBlockData(b3).push(Inst::ret({v0}));
        REQUIRE(function.constructCFG(errorReporter));
        CHECK(errorReporter->ok());

        const auto& cfg = function.cfg();
        CHECK_EQ(cfg.entry(), b0);
        CHECK_EQ(cfg.numberOfEdges(), 4);
        CHECK_EQ(cfg.successors(b0), std::vector<Block>{b1, b2});
        CHECK_EQ(cfg.successors(b2), std::vector<Block>{b3});
        CHECK_EQ(cfg.predecessors(b3), std::vector<Block>{b1, b2});
        CHECK(cfg.successors(b3).empty());
        CHECK(Validator::validateCFG(cfg));
    }

    SUBCASE("successors follow branch target order") {
        Function<Inst> function("order", {}, {});
        auto b0 = function.addEmptyBlock();
        auto b1 = function.addEmptyBlock();
        auto b2 = function.addEmptyBlock();
        // Taken target has the higher key.
        function.mutableBlockData(b0).push(Inst::jcc(x64::kLess, b2, b1));
        function.mutableBlockData(b1).push(Inst::jcc(x64::kEqual, b2, b2));
        function.mutableBlockData(b2).push(Inst::ret());
        REQUIRE(function.constructCFG(errorReporter));

        const auto& cfg = function.cfg();
        CHECK_EQ(cfg.successors(b0), std::vector<Block>{b2, b1});
        CHECK_EQ(cfg.successors(b1), std::vector<Block>{b2});
        CHECK_EQ(cfg.predecessors(b2), std::vector<Block>{b0, b1});
        CHECK_EQ(cfg.predecessors(b1), std::vector<Block>{b0});
        CHECK_EQ(cfg.numberOfEdges(), 3);
        CHECK(Validator::validateCFG(cfg));
    }
}

TEST_CASE("CFGBuilder on a bare block map") {
    PrimaryMap<Block, BlockData<Inst>> blocks;
    BlockData<Inst> entry;
    entry.push(Inst::jmp(Block(1)));
    blocks.insert(std::move(entry));
    BlockData<Inst> exit;
    exit.push(Inst::ret());
    blocks.insert(std::move(exit));

    CFGBuilder builder(std::make_shared<ErrorReporter>());
    auto cfg = builder.build("bare", blocks);
    REQUIRE(cfg);
    CHECK(cfg->hasEdge(Block(0), Block(1)));
    CHECK_EQ(cfg->numberOfEdges(), 1);
}

} // namespace tir
