#ifndef SRC_TIR_VALIDATOR_HPP_
#define SRC_TIR_VALIDATOR_HPP_

#include "tir/Function.hpp"
#include "tir/Inst.hpp"

#include "spdlog/spdlog.h"

namespace tir {

class CFG;
class DominatorTree;
class LivenessAnalysis;
struct RegAllocResult;

// The validator checks the artifacts of each stage of the pipeline for internal consistency. Every check logs the
// first problem it finds and returns false.
class Validator {
public:
    // Every edge appears in both the successor list of its source and the predecessor list of its target.
    static bool validateCFG(const CFG& cfg);
    // The entry dominates every reachable block, and each immediate dominator precedes its block in reverse postorder.
    static bool validateDominatorTree(const CFG& cfg, const DominatorTree& domTree);
    // The live sets of every block are a solution of the dataflow equations.
    static bool validateLiveness(const LivenessAnalysis& liveness);
    // Ranges are sorted, disjoint, fully merged, and cover every point the live sets say a register is live at.
    static bool validateLiveRanges(const LivenessAnalysis& liveness);
    // Every virtual register has exactly one slot, and no two overlapping ranges share a physical register.
    static bool validateAllocation(const LivenessAnalysis& liveness, const RegAllocResult& result);
    // No operand of any instruction still names a virtual register.
    template <typename I> static bool validateRewrite(const Function<I>& function);
};

// static
template <typename I> bool Validator::validateRewrite(const Function<I>& function) {
    for (auto block : function.blocks()) {
        const auto& blockData = function.blockData(block);
        for (size_t i = 0; i < blockData.size(); ++i) {
            const auto& inst = blockData.at(i);
            auto operands = inst.uses();
            auto defs = inst.defs();
            operands.insert(operands.end(), defs.begin(), defs.end());
            for (auto reg : operands) {
                if (reg.isVirtual()) {
                    SPDLOG_ERROR("Virtual register {} remains in block {} instruction {}: {}", regName<I>(reg),
                                 block.index(), i, inst.toString());
                    return false;
                }
            }
        }
    }
    return true;
}

} // namespace tir

#endif // SRC_TIR_VALIDATOR_HPP_
