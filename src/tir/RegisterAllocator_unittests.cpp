#include "tir/RegisterAllocator.hpp"

#include "tir/ErrorReporter.hpp"
#include "tir/Function.hpp"
#include "tir/LivenessAnalysis.hpp"
#include "tir/Validator.hpp"
#include "tir/x64/Inst.hpp"

#include "doctest/doctest.h"

#include <algorithm>
#include <memory>

namespace tir {

using x64::Inst;

namespace {

// Two registers of each class, RAX and RCX for integers.
static constexpr uint32_t kNumberOfTestRegisters = 2;

// After rewriting no operand may name a virtual register.
void validateRewrite(const Function<Inst>& function) {
    for (auto block : function.blocks()) {
        for (const auto& inst : function.blockData(block)) {
            for (auto reg : inst.uses()) {
                CHECK_FALSE(reg.isVirtual());
            }
            for (auto reg : inst.defs()) {
                CHECK_FALSE(reg.isVirtual());
            }
        }
    }
    CHECK(Validator::validateRewrite(function));
}

} // namespace

TEST_CASE("RegisterAllocator forTarget") {
    SUBCASE("every unreserved register") {
        auto allocator = RegisterAllocator::forTarget<Inst>();
        const auto& allocatable = allocator.allocatable();
        CHECK_EQ(allocatable.size(), x64::kNumberOfRegisters - 2);
        CHECK_EQ(allocatable.front(), x64::kRAX);
        CHECK(std::find(allocatable.begin(), allocatable.end(), x64::kRSP) == allocatable.end());
        CHECK(std::find(allocatable.begin(), allocatable.end(), x64::kRBP) == allocatable.end());
    }

    SUBCASE("capped per class") {
        auto allocator = RegisterAllocator::forTarget<Inst>(kNumberOfTestRegisters);
        CHECK_EQ(allocator.allocatable(), std::vector<uint32_t>{x64::kRAX, x64::kRCX, x64::kXMM0, x64::kXMM0 + 1});
    }
}

TEST_CASE("RegisterAllocator straight line") {
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

    LivenessAnalysis liveness(function);
    auto allocator = RegisterAllocator::forTarget<Inst>();
    auto result = allocator.allocateRegisters(function, liveness);
    CHECK(Validator::validateAllocation(liveness, result));

    REQUIRE_EQ(result.allocations.size(), 1);
    CHECK_EQ(result.allocations[0].range.reg, v0);
    CHECK_EQ(result.numberOfSpillSlots, 0);
    // RAX is written while v0 is still live, RDI is read at the same point v0 is defined.
    REQUIRE(result.allocations[0].slot.isRegister());
    CHECK_EQ(result.allocations[0].slot.value, x64::kRCX);

    AllocatedSlot slot;
    REQUIRE(result.slotFor(v0, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRCX));
    CHECK_FALSE(result.slotFor(Reg::virt(RegClass::integer(8), 7), slot));

    REQUIRE(applyAllocation(function, result));
    validateRewrite(function);
    CHECK_EQ(function.blockData(b0).at(0).toString(), "mov rcx, rdi");
    CHECK_EQ(function.blockData(b1).at(0).toString(), "mov rax, rcx");
    CHECK_FALSE(function.hasCFG());
}

TEST_CASE("RegisterAllocator loop") {
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
    auto allocator = RegisterAllocator::forTarget<Inst>();
    auto result = allocator.allocateRegisters(function, liveness);
    CHECK(Validator::validateAllocation(liveness, result));

    AllocatedSlot v0Slot;
    AllocatedSlot v1Slot;
    REQUIRE(result.slotFor(v0, v0Slot));
    REQUIRE(result.slotFor(v1, v1Slot));
    CHECK(v0Slot.isRegister());
    CHECK(v1Slot.isRegister());
    CHECK_NE(v0Slot, v1Slot);

    REQUIRE(applyAllocation(function, result));
    validateRewrite(function);
    CHECK_EQ(function.blockData(b0).at(1).toString(), "add rax, rcx");
    CHECK_EQ(function.blockData(b1).at(0).toString(), "add rax, rcx");
    CHECK_EQ(function.blockData(b2).at(0).toString(), "cmp rax, rcx");
}

TEST_CASE("RegisterAllocator diamond keeps one slot per register") {
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
    auto allocator = RegisterAllocator::forTarget<Inst>();
    auto result = allocator.allocateRegisters(function, liveness);
    CHECK(Validator::validateAllocation(liveness, result));

    // v0 has one range, v1 and v2 two each.
    CHECK_EQ(result.allocations.size(), 5);
    for (size_t i = 1; i < result.allocations.size(); ++i) {
        CHECK(result.allocations[i - 1].range.start <= result.allocations[i].range.start);
    }

    AllocatedSlot v2Slot;
    REQUIRE(result.slotFor(v2, v2Slot));
    for (const auto& allocation : result.allocations) {
        if (allocation.range.reg == v2) {
            CHECK_EQ(allocation.slot, v2Slot);
        }
    }
    // v0 is still live at the start of v2, so v2 cannot reuse its register.
    CHECK_EQ(v2Slot, AllocatedSlot::reg(x64::kRDX));

    REQUIRE(applyAllocation(function, result));
    validateRewrite(function);
    CHECK_EQ(function.blockData(b1).at(0).toString(), "mov rdx, rax");
    CHECK_EQ(function.blockData(b2).at(0).toString(), "mov rdx, rcx");
    CHECK_EQ(function.blockData(b3).at(0).toString(), "ret rdx");
}

TEST_CASE("RegisterAllocator spills under register pressure") {
    Function<Inst> function("pressure", {}, {});
    auto v0 = function.newVReg(RegClass::integer(8));
    auto v1 = function.newVReg(RegClass::integer(8));
    auto v2 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRI(v0, 1));
    function.mutableBlockData(b0).push(Inst::movRI(v1, 2));
    function.mutableBlockData(b0).push(Inst::movRI(v2, 3));
    function.mutableBlockData(b0).push(Inst::add(v0, v1));
    function.mutableBlockData(b0).push(Inst::add(v0, v2));
    function.mutableBlockData(b0).push(Inst::ret({v0}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);

    SUBCASE("enough registers") {
        auto result = RegisterAllocator::forTarget<Inst>().allocateRegisters(function, liveness);
        CHECK(Validator::validateAllocation(liveness, result));
        CHECK_EQ(result.numberOfSpillSlots, 0);
    }

    SUBCASE("two registers") {
        auto allocator = RegisterAllocator::forTarget<Inst>(kNumberOfTestRegisters);
        auto result = allocator.allocateRegisters(function, liveness);
        CHECK(Validator::validateAllocation(liveness, result));
        CHECK_EQ(result.numberOfSpillSlots, 1);

        AllocatedSlot slot;
        REQUIRE(result.slotFor(v0, slot));
        CHECK_EQ(slot, AllocatedSlot::reg(x64::kRAX));
        REQUIRE(result.slotFor(v1, slot));
        CHECK_EQ(slot, AllocatedSlot::reg(x64::kRCX));
        REQUIRE(result.slotFor(v2, slot));
        CHECK_EQ(slot, AllocatedSlot::stack(0));

        REQUIRE(applyAllocation(function, result));
        validateRewrite(function);
        CHECK_EQ(function.blockData(b0).at(2).toString(), "mov s0, 3");
        CHECK_EQ(function.blockData(b0).at(4).toString(), "add rax, s0");
    }

    SUBCASE("no registers") {
        RegisterAllocator allocator(x64::kNumberOfRegisters, {});
        auto result = allocator.allocateRegisters(function, liveness);
        CHECK(Validator::validateAllocation(liveness, result));
        CHECK_EQ(result.numberOfSpillSlots, 3);
        for (const auto& allocation : result.allocations) {
            CHECK(allocation.slot.isStack());
        }
    }

    SUBCASE("registers are reused after expiry") {
        // v1 ends at instruction 3, so a fourth value starting later can take its register.
        auto v3 = function.newVReg(RegClass::integer(8));
        auto& blockData = function.mutableBlockData(b0);
        blockData.at(5) = Inst::movRI(v3, 4);
        blockData.push(Inst::add(v0, v3));
        blockData.push(Inst::ret({v0}));
        REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));
        LivenessAnalysis reused(function);

        RegisterAllocator allocator(x64::kNumberOfRegisters, {x64::kRAX, x64::kRCX, x64::kRDX});
        auto result = allocator.allocateRegisters(function, reused);
        CHECK(Validator::validateAllocation(reused, result));
        CHECK_EQ(result.numberOfSpillSlots, 0);
        AllocatedSlot slot;
        REQUIRE(result.slotFor(v3, slot));
        CHECK_EQ(slot, AllocatedSlot::reg(x64::kRCX));
    }
}

TEST_CASE("RegisterAllocator follows the function generation") {
    Function<Inst> function("stale", {}, {});
    auto v0 = function.newVReg(RegClass::integer(8));
    auto v1 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRI(v0, 1));
    function.mutableBlockData(b0).push(Inst::movRI(v1, 2));
    function.mutableBlockData(b0).push(Inst::add(v1, v1));
    function.mutableBlockData(b0).push(Inst::ret({v1}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    CHECK(function.isCurrent(liveness.generation()));
    auto allocator = RegisterAllocator::forTarget<Inst>();
    auto result = allocator.allocateRegisters(function, liveness);
    CHECK_EQ(result.generation, liveness.generation());
    // v0 is dead before v1 is defined, so both share RAX.
    AllocatedSlot slot;
    REQUIRE(result.slotFor(v0, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRAX));
    REQUIRE(result.slotFor(v1, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRAX));

    // Now v0 lives across the def of v1, and the analysis and allocation above no longer describe the function.
    auto& blockData = function.mutableBlockData(b0);
    blockData.at(2) = Inst::add(v0, v1);
    blockData.at(3) = Inst::ret({v0});
    CHECK_FALSE(function.isCurrent(liveness.generation()));
    CHECK_FALSE(function.isCurrent(result.generation));
    CHECK_FALSE(function.hasCFG());

    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));
    LivenessAnalysis current(function);
    REQUIRE(function.isCurrent(current.generation()));
    auto rebuilt = allocator.allocateRegisters(function, current);
    CHECK(Validator::validateAllocation(current, rebuilt));
    REQUIRE(rebuilt.slotFor(v0, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRAX));
    REQUIRE(rebuilt.slotFor(v1, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRCX));

    REQUIRE(applyAllocation(function, rebuilt));
    validateRewrite(function);
    CHECK_EQ(function.blockData(b0).at(2).toString(), "add rax, rcx");
}

TEST_CASE("RegisterAllocator avoids fixed registers") {
    Function<Inst> function("fixed", {}, {});
    auto v0 = function.newVReg(RegClass::integer(8));
    auto v1 = function.newVReg(RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    // RAX is busy from instruction 0 through 2, covering the start of v0.
    function.mutableBlockData(b0).push(Inst::movRI(x64::gpr(x64::kRAX), 5));
    function.mutableBlockData(b0).push(Inst::movRI(v0, 1));
    function.mutableBlockData(b0).push(Inst::add(v0, x64::gpr(x64::kRAX)));
    // v1 starts after RAX is released.
    function.mutableBlockData(b0).push(Inst::movRI(v1, 2));
    function.mutableBlockData(b0).push(Inst::add(v0, v1));
    function.mutableBlockData(b0).push(Inst::ret({v0}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    auto result = RegisterAllocator::forTarget<Inst>().allocateRegisters(function, liveness);
    CHECK(Validator::validateAllocation(liveness, result));

    AllocatedSlot slot;
    REQUIRE(result.slotFor(v0, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRCX));
    REQUIRE(result.slotFor(v1, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRAX));
}

TEST_CASE("RegisterAllocator register classes") {
    Function<Inst> function("vector", {RegClass::vector(16), RegClass::integer(4)}, {});
    auto vec = function.argument(0);
    auto word = function.argument(1);
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::ret({vec, word}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    auto result = RegisterAllocator::forTarget<Inst>().allocateRegisters(function, liveness);
    CHECK(Validator::validateAllocation(liveness, result));

    AllocatedSlot slot;
    REQUIRE(result.slotFor(vec, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kXMM0));
    REQUIRE(result.slotFor(word, slot));
    CHECK_EQ(slot, AllocatedSlot::reg(x64::kRAX));

    REQUIRE(applyAllocation(function, result));
    // The rewritten register keeps the width of the virtual register.
    CHECK_EQ(function.blockData(b0).at(0).toString(), "ret xmm0, eax");
}

TEST_CASE("Validator rejects unsound allocations") {
    Function<Inst> function("overlap", {RegClass::integer(8), RegClass::integer(8)}, {});
    auto b0 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::add(function.argument(0), function.argument(1)));
    function.mutableBlockData(b0).push(Inst::ret({function.argument(0)}));
    REQUIRE(function.constructCFG(std::make_shared<ErrorReporter>()));

    LivenessAnalysis liveness(function);
    auto result = RegisterAllocator::forTarget<Inst>().allocateRegisters(function, liveness);
    REQUIRE(Validator::validateAllocation(liveness, result));
    REQUIRE_EQ(result.allocations.size(), 2);

    SUBCASE("shared register") {
        result.allocations[1].slot = result.allocations[0].slot;
        CHECK_FALSE(Validator::validateAllocation(liveness, result));
    }

    SUBCASE("missing range") {
        result.allocations.pop_back();
        CHECK_FALSE(Validator::validateAllocation(liveness, result));
    }

    SUBCASE("bad spill slot") {
        result.allocations[1].slot = AllocatedSlot::stack(0);
        CHECK_FALSE(Validator::validateAllocation(liveness, result));
        result.numberOfSpillSlots = 1;
        CHECK(Validator::validateAllocation(liveness, result));
    }
}

} // namespace tir
