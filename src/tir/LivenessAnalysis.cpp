#include "tir/LivenessAnalysis.hpp"

#include "tir/CFG.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace tir {

std::vector<LiveRange> LivenessAnalysis::allRanges() const {
    std::vector<LiveRange> ranges;
    for (const auto& interval : m_intervals) {
        ranges.insert(ranges.end(), interval.ranges().begin(), interval.ranges().end());
    }
    // Ranges were collected in register index order, so a stable sort keeps that order among equal starts.
    std::stable_sort(ranges.begin(), ranges.end(),
                     [](const LiveRange& a, const LiveRange& b) { return a.start < b.start; });
    return ranges;
}

bool LivenessAnalysis::isContiguous(const ProgramPoint& end, const ProgramPoint& nextStart) const {
    if (nextStart.index != 0 || end.index != blockLength(end.block)) {
        return false;
    }

    auto position = std::lower_bound(m_layout.begin(), m_layout.end(), end.block);
    if (position == m_layout.end() || *position != end.block || ++position == m_layout.end()
        || *position != nextStart.block) {
        return false;
    }

    const auto& successors = m_blocks[end.block].successors;
    return std::find(successors.begin(), successors.end(), nextStart.block) != successors.end();
}

void LivenessAnalysis::copyEdges(const CFG& cfg) {
    for (auto block : m_layout) {
        m_blocks[block].successors = cfg.successors(block);
        m_blocks[block].predecessors = cfg.predecessors(block);
    }
}

void LivenessAnalysis::analyze(const std::vector<Block>& reversePostorder) {
    for (auto block : m_layout) {
        auto& info = m_blocks[block];
        info.liveIn = BitSet(m_registers.size());
        info.liveOut = BitSet(m_registers.size());
        info.uses = BitSet(m_registers.size());
        info.defs = BitSet(m_registers.size());
        computeLocalSets(block);
    }

    solveDataflow(reversePostorder);
    buildRanges();
}

void LivenessAnalysis::computeLocalSets(Block block) {
    auto& info = m_blocks[block];
    for (const auto& inst : info.insts) {
        // Uses are read before the defs of the same instruction are written.
        for (auto use : inst.uses) {
            if (!info.defs.has(use)) {
                info.uses.add(use);
            }
        }
        for (auto def : inst.defs) {
            info.defs.add(def);
        }
    }
}

void LivenessAnalysis::solveDataflow(const std::vector<Block>& reversePostorder) {
    BitSet inWorklist(m_blocks.capacity());
    std::vector<Block> worklist;
    worklist.reserve(m_layout.size());

    // Blocks unreachable from the entry still get live sets, they go in after the reachable ones.
    for (auto block : reversePostorder) {
        worklist.emplace_back(block);
        inWorklist.add(block.index());
    }
    for (auto block : m_layout) {
        if (!inWorklist.has(block.index())) {
            worklist.emplace_back(block);
            inWorklist.add(block.index());
        }
    }

    // Popping from the back visits the reachable blocks in postorder first, successors before predecessors.
    while (worklist.size()) {
        auto block = worklist.back();
        worklist.pop_back();
        inWorklist.remove(block.index());
        ++m_iterations;

        auto& info = m_blocks[block];
        BitSet liveOut(m_registers.size());
        for (auto succ : info.successors) {
            liveOut.unionWith(m_blocks[succ].liveIn);
        }
        info.liveOut = liveOut;

        liveOut.subtract(info.defs);
        liveOut.unionWith(info.uses);
        if (liveOut != info.liveIn) {
            info.liveIn = std::move(liveOut);
            for (auto pred : info.predecessors) {
                if (!inWorklist.has(pred.index())) {
                    worklist.emplace_back(pred);
                    inWorklist.add(pred.index());
                }
            }
        }
    }

    SPDLOG_DEBUG("Liveness over {} blocks and {} registers converged after {} iterations", m_layout.size(),
                 m_registers.size(), m_iterations);
}

void LivenessAnalysis::buildRanges() {
    m_intervals.reserve(m_registers.size());
    for (auto reg : m_registers) {
        m_intervals.emplace_back(LiveInterval(reg));
    }

    // Range currently growing for each register within the block being walked.
    struct OpenRange {
        ProgramPoint start;
        ProgramPoint end;
    };
    std::vector<OpenRange> open(m_registers.size());
    BitSet isOpen(m_registers.size());

    for (auto block : m_layout) {
        const auto& info = m_blocks[block];
        auto length = blockLength(block);

        info.liveIn.forEachOne([&](size_t reg) {
            open[reg] = OpenRange{ProgramPoint(block, 0), ProgramPoint(block, 0)};
            isOpen.add(reg);
        });

        for (uint32_t i = 0; i < length; ++i) {
            ProgramPoint point(block, i);
            const auto& inst = info.insts[i];
            for (auto use : inst.uses) {
                if (isOpen.has(use)) {
                    open[use].end = point;
                } else {
                    open[use] = OpenRange{point, point};
                    isOpen.add(use);
                }
            }
            for (auto def : inst.defs) {
                if (isOpen.has(def)) {
                    if (open[def].end == point) {
                        continue;
                    }
                    m_intervals[def].addRange(open[def].start, open[def].end);
                }
                open[def] = OpenRange{point, point};
                isOpen.add(def);
            }
        }

        info.liveOut.forEachOne([&](size_t reg) {
            // A register live out of a block is either live in or defined within it, so a range is open.
            assert(isOpen.has(reg));
            open[reg].end = ProgramPoint(block, length);
        });

        isOpen.forEachOne([&](size_t reg) { m_intervals[reg].addRange(open[reg].start, open[reg].end); });
        isOpen.clear();
    }

    size_t numberOfRanges = 0;
    for (auto& interval : m_intervals) {
        interval.coalesce([this](const ProgramPoint& end, const ProgramPoint& nextStart) {
            return isContiguous(end, nextStart);
        });
        numberOfRanges += interval.ranges().size();
    }

    SPDLOG_DEBUG("Liveness built {} live ranges", numberOfRanges);
}

} // namespace tir
