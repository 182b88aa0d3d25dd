#include "tir/Validator.hpp"

#include "tir/BitSet.hpp"
#include "tir/CFG.hpp"
#include "tir/DominatorTree.hpp"
#include "tir/LivenessAnalysis.hpp"
#include "tir/RegisterAllocator.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <unordered_map>

namespace {

bool contains(const std::vector<tir::Block>& blocks, tir::Block block) {
    return std::find(blocks.begin(), blocks.end(), block) != blocks.end();
}

} // namespace

namespace tir {

// static
bool Validator::validateCFG(const CFG& cfg) {
    for (size_t i = 0; i < cfg.numberOfBlocks(); ++i) {
        Block block(i);
        for (auto succ : cfg.successors(block)) {
            if (!contains(cfg.predecessors(succ), block)) {
                SPDLOG_ERROR("Block {} has successor {} which does not list it as a predecessor", i, succ.index());
                return false;
            }
        }
        for (auto pred : cfg.predecessors(block)) {
            if (!contains(cfg.successors(pred), block)) {
                SPDLOG_ERROR("Block {} has predecessor {} which does not list it as a successor", i, pred.index());
                return false;
            }
        }
    }
    return true;
}

// static
bool Validator::validateDominatorTree(const CFG& cfg, const DominatorTree& domTree) {
    const auto& order = domTree.reversePostorder();
    if (order.empty()) {
        return true;
    }
    if (order.front() != cfg.entry()) {
        SPDLOG_ERROR("Reverse postorder starts with block {} instead of the entry", order.front().index());
        return false;
    }

    for (auto block : order) {
        if (!domTree.dominates(cfg.entry(), block)) {
            SPDLOG_ERROR("Entry does not dominate reachable block {}", block.index());
            return false;
        }
        if (block == cfg.entry()) {
            continue;
        }
        auto idom = domTree.immediateDominator(block);
        if (idom.isNone()) {
            SPDLOG_ERROR("Reachable block {} has no immediate dominator", block.index());
            return false;
        }
        if (domTree.rank(idom) >= domTree.rank(block)) {
            SPDLOG_ERROR("Immediate dominator {} of block {} does not precede it in reverse postorder", idom.index(),
                         block.index());
            return false;
        }
    }
    return true;
}

// static
bool Validator::validateLiveness(const LivenessAnalysis& liveness) {
    for (auto block : liveness.layout()) {
        BitSet liveOut(liveness.numberOfRegisters());
        for (auto succ : liveness.successors(block)) {
            liveOut.unionWith(liveness.liveIn(succ));
        }
        if (liveOut != liveness.liveOut(block)) {
            SPDLOG_ERROR("Block {} live out {} is not the union of its successors live in {}", block.index(),
                         liveness.liveOut(block).toString(), liveOut.toString());
            return false;
        }

        BitSet liveIn = liveOut;
        liveIn.subtract(liveness.defs(block));
        liveIn.unionWith(liveness.uses(block));
        if (liveIn != liveness.liveIn(block)) {
            SPDLOG_ERROR("Block {} live in {} does not match (live out - defs) + uses {}", block.index(),
                         liveness.liveIn(block).toString(), liveIn.toString());
            return false;
        }
    }
    return true;
}

// static
bool Validator::validateLiveRanges(const LivenessAnalysis& liveness) {
    for (uint32_t i = 0; i < liveness.numberOfRegisters(); ++i) {
        const auto& ranges = liveness.ranges(i);
        for (size_t j = 0; j < ranges.size(); ++j) {
            if (ranges[j].reg != liveness.reg(i)) {
                SPDLOG_ERROR("Range {} of register index {} belongs to another register", ranges[j].toString(), i);
                return false;
            }
            if (j == 0) {
                continue;
            }
            if (ranges[j].start <= ranges[j - 1].end) {
                SPDLOG_ERROR("Register index {} has overlapping or unsorted ranges {} and {}", i,
                             ranges[j - 1].toString(), ranges[j].toString());
                return false;
            }
            if (liveness.isContiguous(ranges[j - 1].end, ranges[j].start)) {
                SPDLOG_ERROR("Register index {} has unmerged contiguous ranges {} and {}", i,
                             ranges[j - 1].toString(), ranges[j].toString());
                return false;
            }
        }
    }

    for (auto block : liveness.layout()) {
        for (auto reg : liveness.liveIn(block).ones()) {
            ProgramPoint start(block, 0);
            if (!liveness.interval(static_cast<uint32_t>(reg)).covers(start)) {
                SPDLOG_ERROR("Register index {} live into block {} has no range covering {}", reg, block.index(),
                             start.toString());
                return false;
            }
        }
        for (auto reg : liveness.liveOut(block).ones()) {
            ProgramPoint end(block, liveness.blockLength(block));
            if (!liveness.interval(static_cast<uint32_t>(reg)).covers(end)) {
                SPDLOG_ERROR("Register index {} live out of block {} has no range covering {}", reg, block.index(),
                             end.toString());
                return false;
            }
        }
    }
    return true;
}

// static
bool Validator::validateAllocation(const LivenessAnalysis& liveness, const RegAllocResult& result) {
    std::unordered_map<uint32_t, AllocatedSlot> slots;
    for (const auto& allocation : result.allocations) {
        const auto& reg = allocation.range.reg;
        if (!reg.isVirtual()) {
            SPDLOG_ERROR("Allocation for non-virtual register bits {:#x}", reg.bits());
            return false;
        }
        auto iter = slots.find(reg.id());
        if (iter != slots.end() && iter->second != allocation.slot) {
            SPDLOG_ERROR("Virtual register v{} assigned both {} and {}", reg.id(), iter->second.toString(),
                         allocation.slot.toString());
            return false;
        }
        slots.emplace(reg.id(), allocation.slot);

        if (allocation.slot.isStack() && allocation.slot.value >= result.numberOfSpillSlots) {
            SPDLOG_ERROR("Virtual register v{} assigned out of range spill slot {}", reg.id(), allocation.slot.value);
            return false;
        }
        if (allocation.slot.isRegister()) {
            if (allocation.slot.value >= liveness.numberOfPhysicalRegisters()) {
                SPDLOG_ERROR("Virtual register v{} assigned nonexistent register {}", reg.id(), allocation.slot.value);
                return false;
            }
            if (liveness.interval(allocation.slot.value).intersects(allocation.range.start, allocation.range.end)) {
                SPDLOG_ERROR("Virtual register v{} range {} collides with a fixed use of register {}", reg.id(),
                             allocation.range.toString(), allocation.slot.value);
                return false;
            }
        }
    }

    size_t numberOfRanges = 0;
    for (auto i = liveness.numberOfPhysicalRegisters(); i < liveness.numberOfRegisters(); ++i) {
        const auto& ranges = liveness.ranges(i);
        numberOfRanges += ranges.size();
        if (ranges.size() && slots.find(liveness.reg(i).id()) == slots.end()) {
            SPDLOG_ERROR("Live virtual register v{} has no allocation", liveness.reg(i).id());
            return false;
        }
    }
    if (numberOfRanges != result.allocations.size()) {
        SPDLOG_ERROR("Expected {} allocations, one per virtual live range, got {}", numberOfRanges,
                     result.allocations.size());
        return false;
    }

    // Allocations are sorted by start, so only later allocations starting before this one ends can overlap it.
    for (size_t i = 0; i < result.allocations.size(); ++i) {
        const auto& a = result.allocations[i];
        if (i > 0 && a.range.start < result.allocations[i - 1].range.start) {
            SPDLOG_ERROR("Allocations are not sorted by range start at {}", a.range.toString());
            return false;
        }
        if (!a.slot.isRegister()) {
            continue;
        }
        for (size_t j = i + 1; j < result.allocations.size(); ++j) {
            const auto& b = result.allocations[j];
            if (a.range.end < b.range.start) {
                break;
            }
            if (b.slot == a.slot && b.range.reg != a.range.reg) {
                SPDLOG_ERROR("Virtual registers v{} and v{} share register {} over overlapping ranges {} and {}",
                             a.range.reg.id(), b.range.reg.id(), a.slot.value, a.range.toString(),
                             b.range.toString());
                return false;
            }
        }
    }
    return true;
}

} // namespace tir
