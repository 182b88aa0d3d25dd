#include "tir/RegisterAllocator.hpp"

#include "tir/LivenessAnalysis.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace tir {

bool RegAllocResult::slotFor(Reg vreg, AllocatedSlot& slot) const {
    for (const auto& allocation : allocations) {
        if (allocation.range.reg == vreg) {
            slot = allocation.slot;
            return true;
        }
    }
    return false;
}

RegisterAllocator::RegisterAllocator(uint32_t numberOfPhysicalRegisters, std::vector<uint32_t> allocatable):
    m_numberOfPhysicalRegisters(numberOfPhysicalRegisters),
    m_allocatable(std::move(allocatable)),
    m_numberOfSpillSlots(0) {
    for (auto id : m_allocatable) {
        assert(id < m_numberOfPhysicalRegisters);
    }
}

RegAllocResult RegisterAllocator::allocate(const LivenessAnalysis& liveness) {
    assert(liveness.numberOfPhysicalRegisters() == m_numberOfPhysicalRegisters);

    m_active = BitSet(m_numberOfPhysicalRegisters);
    m_expiry.clear();
    m_numberOfSpillSlots = 0;

    // unhandled = list of intervals sorted by increasing start positions, ties broken by register index.
    std::vector<uint32_t> unhandled;
    for (auto i = liveness.numberOfPhysicalRegisters(); i < liveness.numberOfRegisters(); ++i) {
        if (!liveness.interval(i).isEmpty()) {
            unhandled.emplace_back(i);
        }
    }
    std::stable_sort(unhandled.begin(), unhandled.end(), [&liveness](uint32_t a, uint32_t b) {
        return liveness.interval(a).start() < liveness.interval(b).start();
    });

    RegAllocResult result;
    result.generation = liveness.generation();
    uint32_t numberOfRegisterAllocations = 0;

    for (auto regIndex : unhandled) {
        const auto& current = liveness.interval(regIndex);
        expire(current.start());

        AllocatedSlot slot;
        uint32_t chosen = 0;
        if (tryAllocateFreeReg(current, liveness, chosen)) {
            slot = AllocatedSlot::reg(chosen);
            ++numberOfRegisterAllocations;
        } else {
            slot = AllocatedSlot::stack(m_numberOfSpillSlots);
            ++m_numberOfSpillSlots;
        }
        SPDLOG_DEBUG("Register index {} from {} to {} assigned {}", regIndex, current.start().toString(),
                     current.end().toString(), slot.toString());

        for (const auto& range : current.ranges()) {
            result.allocations.emplace_back(Allocation{range, slot});
        }
    }

    std::stable_sort(result.allocations.begin(), result.allocations.end(),
                     [](const Allocation& a, const Allocation& b) { return a.range.start < b.range.start; });
    result.numberOfSpillSlots = m_numberOfSpillSlots;

    SPDLOG_DEBUG("Allocated {} virtual registers, {} to physical registers and {} to spill slots", unhandled.size(),
                 numberOfRegisterAllocations, m_numberOfSpillSlots);
    return result;
}

bool RegisterAllocator::tryAllocateFreeReg(const LiveInterval& current, const LivenessAnalysis& liveness,
                                           uint32_t& chosen) {
    bool wantsInteger = current.reg().regClass().kind == RegClass::kInt;
    const auto& position = current.start();

    for (auto id : m_allocatable) {
        if (m_active.has(id)) {
            continue;
        }
        if ((liveness.reg(id).regClass().kind == RegClass::kInt) != wantsInteger) {
            continue;
        }

        const auto& fixed = liveness.interval(id);
        if (fixed.covers(position)) {
            // Busy at the start of |current|, so busy until its own range ends.
            for (const auto& range : fixed.ranges()) {
                if (range.covers(position)) {
                    m_active.add(id);
                    m_expiry.emplace(std::make_pair(range.end, id));
                    break;
                }
            }
            continue;
        }
        if (fixed.intersects(current.start(), current.end())) {
            continue;
        }

        chosen = id;
        m_active.add(id);
        m_expiry.emplace(std::make_pair(current.end(), id));
        return true;
    }

    return false;
}

void RegisterAllocator::expire(const ProgramPoint& position) {
    auto iter = m_expiry.begin();
    while (iter != m_expiry.end() && iter->first < position) {
        m_active.remove(iter->second);
        iter = m_expiry.erase(iter);
    }
}

} // namespace tir
