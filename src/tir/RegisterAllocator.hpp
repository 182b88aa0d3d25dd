#ifndef SRC_TIR_REGISTER_ALLOCATOR_HPP_
#define SRC_TIR_REGISTER_ALLOCATOR_HPP_

#include "tir/BitSet.hpp"
#include "tir/Function.hpp"
#include "tir/LiveRange.hpp"
#include "tir/LivenessAnalysis.hpp"
#include "tir/Register.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tir {

// Where a virtual register lives after allocation: physical register |value| or stack slot |value|.
struct AllocatedSlot {
    enum Kind : uint8_t { kRegister, kStack };

    AllocatedSlot(): kind(kStack), value(0) {}
    AllocatedSlot(Kind k, uint32_t v): kind(k), value(v) {}
    ~AllocatedSlot() = default;

    static AllocatedSlot reg(uint32_t id) { return AllocatedSlot(kRegister, id); }
    static AllocatedSlot stack(uint32_t slot) { return AllocatedSlot(kStack, slot); }

    inline bool isRegister() const { return kind == kRegister; }
    inline bool isStack() const { return kind == kStack; }

    bool operator==(const AllocatedSlot& s) const { return kind == s.kind && value == s.value; }
    bool operator!=(const AllocatedSlot& s) const { return !(*this == s); }

    std::string toString() const { return fmt::format("{}{}", isRegister() ? "reg " : "stack ", value); }

    Kind kind;
    uint32_t value;
};

struct Allocation {
    LiveRange range;
    AllocatedSlot slot;
};

struct RegAllocResult {
    // Finds the slot assigned to virtual register |vreg|. Returns false if the allocator never saw it.
    bool slotFor(Reg vreg, AllocatedSlot& slot) const;

    // One entry per live range of every virtual register, ordered by range start.
    std::vector<Allocation> allocations;
    uint32_t numberOfSpillSlots = 0;
    // Generation of the function the liveness analysis was computed from.
    uint64_t generation = 0;
};

/*
Linear scan after "Linear Scan Register Allocation" by M. Poletto and V. Sarkar, over whole register intervals, with
the fixed intervals of physical registers taken into account:

LINEARSCAN
    active = { }
    for each virtual interval current, in order of increasing start position do
        position = start position of current

        // expire old intervals
        for each (end, reg) in active with end < position do
            remove reg from active

        // find a register for current
        TRYALLOCATEFREEREG
        if allocation failed then
            current.slot = new stack slot

TRYALLOCATEFREEREG
    for each allocatable reg not in active, in preference order do
        if class of reg cannot hold current then
            skip reg
        else if fixed interval of reg covers position then
            add (end of covering fixed range, reg) to active
        else if fixed interval of reg intersects [start of current, end of current] then
            skip reg
        else
            current.slot = reg
            add (end of current, reg) to active
            return success
    return failure
*/
class RegisterAllocator {
public:
    RegisterAllocator() = delete;
    // |allocatable| lists the ids of the physical registers that may be handed out, in order of preference.
    RegisterAllocator(uint32_t numberOfPhysicalRegisters, std::vector<uint32_t> allocatable);
    ~RegisterAllocator() = default;

    // Allocator handing out every non-reserved register of target |I|, at most |maxPerClass| of integer registers and
    // at most |maxPerClass| of the others.
    template <typename I>
    static RegisterAllocator forTarget(uint32_t maxPerClass = std::numeric_limits<uint32_t>::max());

    // Allocates every virtual register of |function|. |liveness| must describe the function as it is now, a stale
    // analysis is logged and yields an empty result stamped with the stale generation, which applyAllocation refuses.
    template <typename I>
    RegAllocResult allocateRegisters(const Function<I>& function, const LivenessAnalysis& liveness);

    const std::vector<uint32_t>& allocatable() const { return m_allocatable; }

private:
    RegAllocResult allocate(const LivenessAnalysis& liveness);
    bool tryAllocateFreeReg(const LiveInterval& current, const LivenessAnalysis& liveness, uint32_t& chosen);
    void expire(const ProgramPoint& position);

    uint32_t m_numberOfPhysicalRegisters;
    std::vector<uint32_t> m_allocatable;
    BitSet m_active;
    // Ordered by the end point at which the paired physical register becomes free again.
    std::set<std::pair<ProgramPoint, uint32_t>> m_expiry;
    uint32_t m_numberOfSpillSlots;
};

// static
template <typename I> RegisterAllocator RegisterAllocator::forTarget(uint32_t maxPerClass) {
    std::vector<uint32_t> allocatable;
    uint32_t integerCount = 0;
    uint32_t otherCount = 0;
    for (uint32_t i = 0; i < I::physicalRegisterCount(); ++i) {
        if (I::isReservedRegister(i)) {
            continue;
        }
        auto& count = I::physicalRegister(i).regClass().kind == RegClass::kInt ? integerCount : otherCount;
        if (count < maxPerClass) {
            allocatable.emplace_back(i);
            ++count;
        }
    }
    return RegisterAllocator(I::physicalRegisterCount(), std::move(allocatable));
}

template <typename I>
RegAllocResult RegisterAllocator::allocateRegisters(const Function<I>& function, const LivenessAnalysis& liveness) {
    if (!function.isCurrent(liveness.generation())) {
        SPDLOG_CRITICAL("Liveness for '{}' was computed at generation {} but the function is at generation {}",
                        function.name(), liveness.generation(), function.generation());
        assert(false);
        RegAllocResult result;
        result.generation = liveness.generation();
        return result;
    }
    return allocate(liveness);
}

// Rewrites every virtual register operand of |function| to the physical register or spill slot |result| assigned to
// it. Walks program points in layout order and binds a virtual register to its slot once the first of its ranges has
// started. Physical operands are left alone. Returns false, after logging, if an operand refers to a virtual register
// the result does not bind, which means allocation was incomplete, or if |result| is stale.
template <typename I> bool applyAllocation(Function<I>& function, const RegAllocResult& result) {
    if (!function.isCurrent(result.generation)) {
        SPDLOG_CRITICAL("Allocation for '{}' was computed at generation {} but the function is at generation {}",
                        function.name(), result.generation, function.generation());
        assert(false);
        return false;
    }

    std::vector<AllocatedSlot> bindings(function.numberOfVRegs());
    BitSet bound(function.numberOfVRegs());
    size_t next = 0;

    for (auto block : function.blocks()) {
        auto& blockData = function.mutableBlockData(block);
        for (uint32_t i = 0; i < blockData.size(); ++i) {
            ProgramPoint point(block, i);
            while (next < result.allocations.size() && result.allocations[next].range.start <= point) {
                const auto& allocation = result.allocations[next];
                assert(allocation.range.reg.isVirtual());
                auto id = allocation.range.reg.id();
                bindings[id] = allocation.slot;
                bound.add(id);
                ++next;
            }

            auto inst = blockData.at(i);
            auto operands = inst.uses();
            auto defs = inst.defs();
            operands.insert(operands.end(), defs.begin(), defs.end());
            for (auto reg : operands) {
                if (!reg.isVirtual()) {
                    continue;
                }
                if (!bound.has(reg.id())) {
                    SPDLOG_CRITICAL("Virtual register v{} in block {} instruction {} has no allocated slot", reg.id(),
                                    block.index(), i);
                    assert(false);
                    return false;
                }
                const auto& slot = bindings[reg.id()];
                auto replacement = slot.isRegister() ? Reg::physical(reg.regClass(), slot.value)
                                                     : Reg::spill(reg.regClass(), slot.value);
                inst = inst.replace(reg, replacement);
            }
            blockData.at(i) = inst;
        }
    }

    return true;
}

} // namespace tir

#endif // SRC_TIR_REGISTER_ALLOCATOR_HPP_
