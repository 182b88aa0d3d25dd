#include "tir/Pipeline.hpp"

#include "tir/ErrorReporter.hpp"
#include "tir/Function.hpp"
#include "tir/x64/Inst.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace tir {

using x64::Inst;

namespace {

// Records which steps ran and can stop the pipeline after any one of them.
class TestPipeline : public Pipeline<Inst> {
public:
    // Validation is switched on at runtime, whatever TIR_PIPELINE_VALIDATE the build chose.
    TestPipeline(): Pipeline<Inst>(std::make_shared<ErrorReporter>(true)) { setValidate(true); }
    virtual ~TestPipeline() = default;

    std::string steps;
    std::string stopAfter;

protected:
    bool step(const std::string& name) {
        steps += name + " ";
        return name != stopAfter;
    }

    bool afterCFG(const Function<Inst>& function) override {
        CHECK(function.hasCFG());
        return step("cfg");
    }
    bool afterDominatorTree(const Function<Inst>& function, const DominatorTree& domTree) override {
        CHECK(function.hasDominatorTree());
        CHECK_EQ(domTree.reversePostorder().front(), function.entryBlock());
        return step("domTree");
    }
    bool afterLiveness(const Function<Inst>& function, const LivenessAnalysis& liveness) override {
        CHECK(function.isCurrent(liveness.generation()));
        return step("liveness");
    }
    bool afterAllocation(const Function<Inst>& function, const LivenessAnalysis& liveness,
                         const RegAllocResult& result) override {
        CHECK(function.isCurrent(result.generation));
        CHECK(Validator::validateAllocation(liveness, result));
        return step("allocation");
    }
    bool afterRewrite(const Function<Inst>& function) override {
        CHECK(Validator::validateRewrite(function));
        return step("rewrite");
    }
};

// Three values live at once in a single block.
void buildPressure(Function<Inst>& function) {
    auto v0 = function.newVReg(RegClass::integer(8));
    auto v1 = function.newVReg(RegClass::integer(8));
    auto v2 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    auto& blockData = function.mutableBlockData(b0);
    blockData.push(Inst::movRI(v0, 1));
    blockData.push(Inst::movRI(v1, 2));
    blockData.push(Inst::movRI(v2, 3));
    blockData.push(Inst::add(v0, v1));
    blockData.push(Inst::add(v0, v2));
    blockData.push(Inst::ret({v0}));
}

} // namespace

TEST_CASE("Pipeline runs every step") {
    Function<Inst> function("sum", {RegClass::integer(8), RegClass::integer(8)}, {});
    auto v0 = function.argument(0);
    auto v1 = function.argument(1);
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    auto b2 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::cmp(v0, v1));
    function.mutableBlockData(b0).push(Inst::jcc(x64::kGreater, b1, b2));
    function.mutableBlockData(b1).push(Inst::add(v0, v1));
    function.mutableBlockData(b1).push(Inst::jmp(b2));
    function.mutableBlockData(b2).push(Inst::movRR(x64::gpr(x64::kRAX), v0));
    function.mutableBlockData(b2).push(Inst::ret({x64::gpr(x64::kRAX)}));

    TestPipeline pipeline;
    CHECK(pipeline.validate());
    REQUIRE(pipeline.run(function));
    CHECK_EQ(pipeline.steps, "cfg domTree liveness allocation rewrite ");
    CHECK(pipeline.errorReporter()->ok());
    REQUIRE(pipeline.liveness());
    REQUIRE(pipeline.allocation());
    CHECK_EQ(pipeline.allocation()->numberOfSpillSlots, 0);

    // RAX is written while v0 is still live, v1 is dead by then and may take it.
    CHECK_EQ(function.blockData(b0).at(0).toString(), "cmp rcx, rax");
    CHECK_EQ(function.blockData(b1).at(0).toString(), "add rcx, rax");
    CHECK_EQ(function.blockData(b2).at(0).toString(), "mov rax, rcx");
}

TEST_CASE("Pipeline reports construction errors") {
    Function<Inst> function("broken", {}, {});
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRI(x64::gpr(x64::kRAX), 0));

    TestPipeline pipeline;
    CHECK_FALSE(pipeline.run(function));
    CHECK(pipeline.steps.empty());
    REQUIRE_EQ(pipeline.errorReporter()->errorCount(), 1);
    CHECK_EQ(pipeline.errorReporter()->lastError().code, kBlockNotTerminated);
    CHECK_FALSE(pipeline.liveness());
    CHECK_FALSE(pipeline.allocation());
}

TEST_CASE("Pipeline stops when a step asks it to") {
    Function<Inst> function("pressure", {}, {});
    buildPressure(function);
    auto before = function.toString();

    SUBCASE("after liveness") {
        TestPipeline pipeline;
        pipeline.stopAfter = "liveness";
        CHECK_FALSE(pipeline.run(function));
        CHECK_EQ(pipeline.steps, "cfg domTree liveness ");
        CHECK(pipeline.liveness());
        CHECK_FALSE(pipeline.allocation());
        CHECK_EQ(function.toString(), before);
        CHECK(function.hasCFG());
    }

    SUBCASE("after allocation") {
        TestPipeline pipeline;
        pipeline.stopAfter = "allocation";
        CHECK_FALSE(pipeline.run(function));
        CHECK_EQ(pipeline.steps, "cfg domTree liveness allocation ");
        CHECK(pipeline.allocation());
        // The function is only modified by the rewrite.
        CHECK_EQ(function.toString(), before);
    }
}

TEST_CASE("Pipeline with a capped register file") {
    Function<Inst> function("pressure", {}, {});
    buildPressure(function);

    TestPipeline pipeline;
    pipeline.setNumberOfRegisters(2);
    CHECK_EQ(pipeline.numberOfRegisters(), 2);
    REQUIRE(pipeline.run(function));
    REQUIRE(pipeline.allocation());
    CHECK_EQ(pipeline.allocation()->numberOfSpillSlots, 1);

    auto b0 = function.entryBlock();
    CHECK_EQ(function.blockData(b0).at(0).toString(), "mov rax, 1");
    CHECK_EQ(function.blockData(b0).at(1).toString(), "mov rcx, 2");
    CHECK_EQ(function.blockData(b0).at(2).toString(), "mov s0, 3");
    CHECK_EQ(function.blockData(b0).at(3).toString(), "add rax, rcx");
    CHECK_EQ(function.blockData(b0).at(4).toString(), "add rax, s0");
    CHECK_EQ(function.blockData(b0).at(5).toString(), "ret rax");

    // A second run over the rewritten function has nothing left to allocate.
    TestPipeline again;
    REQUIRE(again.run(function));
    CHECK(again.allocation()->allocations.empty());
}

TEST_CASE("Pipeline without validation") {
    Function<Inst> function("pressure", {}, {});
    buildPressure(function);

    Pipeline<Inst> pipeline;
    pipeline.setValidate(false);
    CHECK_FALSE(pipeline.validate());
    REQUIRE(pipeline.run(function));
    CHECK(Validator::validateRewrite(function));
}

} // namespace tir
