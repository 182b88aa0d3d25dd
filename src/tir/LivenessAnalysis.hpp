#ifndef SRC_TIR_LIVENESS_ANALYSIS_HPP_
#define SRC_TIR_LIVENESS_ANALYSIS_HPP_

#include "tir/Arena.hpp"
#include "tir/BitSet.hpp"
#include "tir/Block.hpp"
#include "tir/DominatorTree.hpp"
#include "tir/Function.hpp"
#include "tir/Inst.hpp"
#include "tir/LiveRange.hpp"
#include "tir/Register.hpp"

#include "fmt/format.h"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

namespace tir {

class CFG;

// Backward dataflow liveness over one function, followed by conversion of the per-block live sets into live ranges
// anchored at program points. Registers are tracked in a single dense index space: physical register p is index p and
// virtual register v is index physicalRegisterCount() + v. Spill slots are not tracked.
//
// The analysis copies what it needs out of the function, so it stays readable after the function changes, but it
// describes the function only as of generation(). Check with Function::isCurrent() before trusting it.
class LivenessAnalysis {
public:
    LivenessAnalysis() = delete;

    // Requires a current CFG on |function|.
    template <typename I> explicit LivenessAnalysis(const Function<I>& function);
    ~LivenessAnalysis() = default;

    const BitSet& liveIn(Block block) const { return m_blocks[block].liveIn; }
    const BitSet& liveOut(Block block) const { return m_blocks[block].liveOut; }
    // Registers read in |block| before any write to them within the block.
    const BitSet& uses(Block block) const { return m_blocks[block].uses; }
    const BitSet& defs(Block block) const { return m_blocks[block].defs; }
    // CFG edges as they were when the analysis ran.
    const std::vector<Block>& successors(Block block) const { return m_blocks[block].successors; }

    // Merged, sorted, non-overlapping ranges of the register at |regIndex|.
    const std::vector<LiveRange>& ranges(uint32_t regIndex) const { return interval(regIndex).ranges(); }
    const LiveInterval& interval(uint32_t regIndex) const {
        assert(regIndex < m_intervals.size());
        return m_intervals[regIndex];
    }
    // Every range of every register, ordered by start point and then by register index.
    std::vector<LiveRange> allRanges() const;

    uint32_t numberOfRegisters() const { return static_cast<uint32_t>(m_registers.size()); }
    uint32_t numberOfPhysicalRegisters() const { return m_numberOfPhysicalRegisters; }
    // Register at |regIndex|. Physical registers are reported at full width.
    Reg reg(uint32_t regIndex) const {
        assert(regIndex < m_registers.size());
        return m_registers[regIndex];
    }
    // Index of |reg|, which must be physical or virtual.
    uint32_t regIndex(Reg reg) const {
        assert(reg.isPhysical() || reg.isVirtual());
        return reg.isPhysical() ? reg.id() : m_numberOfPhysicalRegisters + reg.id();
    }
    bool isVirtual(uint32_t regIndex) const { return regIndex >= m_numberOfPhysicalRegisters; }

    // Blocks in layout order, which is ascending key order.
    const std::vector<Block>& layout() const { return m_layout; }
    // Number of instructions in |block|. The program point (block, blockLength(block)) is the end of the block.
    uint32_t blockLength(Block block) const { return static_cast<uint32_t>(m_blocks[block].insts.size()); }
    // True if a range ending at |end| continues without a gap into a range starting at |nextStart|.
    bool isContiguous(const ProgramPoint& end, const ProgramPoint& nextStart) const;

    // Number of blocks popped from the worklist before the fixed point was reached.
    size_t iterations() const { return m_iterations; }
    uint64_t generation() const { return m_generation; }

    // Per-block live sets followed by the ranges of every live register.
    template <typename I> std::string toString() const;

private:
    // Register indices an instruction reads and writes.
    struct InstRegisters {
        std::vector<uint32_t> uses;
        std::vector<uint32_t> defs;
    };

    struct BlockInfo {
        std::vector<InstRegisters> insts;
        std::vector<Block> successors;
        std::vector<Block> predecessors;
        BitSet liveIn;
        BitSet liveOut;
        BitSet uses;
        BitSet defs;
    };

    template <typename I> void gather(const Function<I>& function);
    void copyEdges(const CFG& cfg);
    void analyze(const std::vector<Block>& reversePostorder);
    void computeLocalSets(Block block);
    void solveDataflow(const std::vector<Block>& reversePostorder);
    void buildRanges();

    uint32_t m_numberOfPhysicalRegisters;
    std::vector<Reg> m_registers;
    std::vector<Block> m_layout;
    SecondaryMap<Block, BlockInfo> m_blocks;
    std::vector<LiveInterval> m_intervals;
    size_t m_iterations;
    uint64_t m_generation;
};

template <typename I>
LivenessAnalysis::LivenessAnalysis(const Function<I>& function):
    m_numberOfPhysicalRegisters(I::physicalRegisterCount()),
    m_blocks(function.blockCapacity()),
    m_iterations(0),
    m_generation(function.generation()) {
    assert(function.hasCFG());
    gather(function);
    copyEdges(function.cfg());
    analyze(DominatorTree::computeReversePostorder(function.cfg()));
}

template <typename I> void LivenessAnalysis::gather(const Function<I>& function) {
    m_registers.reserve(function.numberOfRegisters());
    for (uint32_t i = 0; i < m_numberOfPhysicalRegisters; ++i) {
        m_registers.emplace_back(I::physicalRegister(i));
    }
    for (uint32_t i = 0; i < function.numberOfVRegs(); ++i) {
        m_registers.emplace_back(Reg::virt(function.vRegClass(i), i));
    }

    auto toIndices = [this](const std::vector<Reg>& regs, std::vector<uint32_t>& indices) {
        for (auto reg : regs) {
            if (reg.isPhysical() || reg.isVirtual()) {
                indices.emplace_back(regIndex(reg));
                assert(indices.back() < m_registers.size());
            }
        }
    };

    m_layout = function.blocks();
    for (auto block : m_layout) {
        auto& info = m_blocks[block];
        const auto& blockData = function.blockData(block);
        info.insts.reserve(blockData.size());
        for (const auto& inst : blockData) {
            InstRegisters registers;
            toIndices(inst.uses(), registers.uses);
            toIndices(inst.defs(), registers.defs);
            info.insts.emplace_back(std::move(registers));
        }
    }
}

template <typename I> std::string LivenessAnalysis::toString() const {
    auto setToString = [this](const BitSet& set) {
        std::string text = "{";
        bool first = true;
        set.forEachOne([this, &text, &first](size_t index) {
            text += first ? "" : ", ";
            text += regName<I>(m_registers[index]);
            first = false;
        });
        return text + "}";
    };

    std::string text;
    for (auto block : m_layout) {
        text += fmt::format("block{}: in {} out {}\n", block.index(), setToString(liveIn(block)),
                            setToString(liveOut(block)));
    }
    for (uint32_t i = 0; i < m_intervals.size(); ++i) {
        if (m_intervals[i].isEmpty()) {
            continue;
        }
        text += fmt::format("{}:", regName<I>(m_registers[i]));
        for (const auto& range : m_intervals[i].ranges()) {
            text += fmt::format(" {}", range.toString());
        }
        text += "\n";
    }
    return text;
}

} // namespace tir

#endif // SRC_TIR_LIVENESS_ANALYSIS_HPP_
