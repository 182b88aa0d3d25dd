#ifndef SRC_TIR_FUNCTION_HPP_
#define SRC_TIR_FUNCTION_HPP_

#include "tir/Arena.hpp"
#include "tir/Block.hpp"
#include "tir/CFG.hpp"
#include "tir/CFGBuilder.hpp"
#include "tir/DominatorTree.hpp"
#include "tir/ErrorReporter.hpp"
#include "tir/Inst.hpp"
#include "tir/Register.hpp"

#include "fmt/format.h"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

namespace tir {

// A single function: an arena of blocks, the virtual register counter, and the argument and result registers.
// Block 0 is the entry. The function caches its CFG and dominator tree, both stamped with the generation of the
// function they were built from. Every operation that can change block contents bumps the generation, after which
// the caches must be rebuilt before use. Analyses built outside the Function (liveness, allocation) record the
// generation too and can be checked with isCurrent().
template <typename I> class Function {
public:
    using Inst = I;

    Function() = delete;
    Function(std::string name, const std::vector<RegClass>& argumentClasses,
             const std::vector<RegClass>& resultClasses):
        m_name(std::move(name)), m_generation(0), m_cfgGeneration(0), m_domTreeGeneration(0) {
        static_assert(InstTraits<I>::check(), "instruction type does not satisfy the instruction contract");
        for (const auto& argumentClass : argumentClasses) {
            m_arguments.emplace_back(newVReg(argumentClass));
        }
        for (const auto& resultClass : resultClasses) {
            m_results.emplace_back(newVReg(resultClass));
        }
    }
    ~Function() = default;

    Block addBlock(BlockData<I> data) {
        invalidate();
        return m_blocks.insert(std::move(data));
    }
    Block addEmptyBlock() { return addBlock(BlockData<I>()); }

    const BlockData<I>& blockData(Block block) const { return m_blocks[block]; }
    // Mutable access assumes the caller will change the block and invalidates the cached CFG.
    BlockData<I>& mutableBlockData(Block block) {
        invalidate();
        return m_blocks[block];
    }

    // Allocates the next virtual register. Ids are never reused within one function.
    Reg newVReg(RegClass regClass) {
        auto reg = Reg::virt(regClass, static_cast<uint32_t>(m_vRegClasses.size()));
        m_vRegClasses.emplace_back(regClass);
        return reg;
    }

    // Builds and caches the CFG. On failure reports the error, returns false and caches nothing.
    bool constructCFG(std::shared_ptr<ErrorReporter> errorReporter) {
        m_cfg.reset();
        m_domTree.reset();
        CFGBuilder builder(errorReporter);
        auto cfg = builder.build(m_name, m_blocks);
        if (!cfg) {
            return false;
        }
        m_cfg = std::move(cfg);
        m_cfgGeneration = m_generation;
        return true;
    }
    bool hasCFG() const { return m_cfg && m_cfgGeneration == m_generation; }
    const CFG& cfg() const {
        assert(hasCFG());
        return *m_cfg;
    }

    // Builds and caches the dominator tree, requires a current CFG.
    const DominatorTree& constructDominatorTree() {
        assert(hasCFG());
        m_domTree = std::make_unique<DominatorTree>(*m_cfg);
        m_domTreeGeneration = m_generation;
        return *m_domTree;
    }
    bool hasDominatorTree() const { return m_domTree && m_domTreeGeneration == m_generation; }
    const DominatorTree& dominatorTree() const {
        assert(hasDominatorTree());
        return *m_domTree;
    }

    // Returns Block::none() if the function has no blocks.
    Block entryBlock() const { return m_blocks.contains(Block(0)) ? Block(0) : Block::none(); }
    std::vector<Block> blocks() const { return m_blocks.keys(); }
    size_t numberOfBlocks() const { return m_blocks.size(); }
    // Size of the block key space, for sizing per-block tables.
    size_t blockCapacity() const { return m_blocks.capacity(); }

    Reg argument(size_t i) const { assert(i < m_arguments.size()); return m_arguments[i]; }
    Reg result(size_t i) const { assert(i < m_results.size()); return m_results[i]; }
    const std::vector<Reg>& arguments() const { return m_arguments; }
    const std::vector<Reg>& results() const { return m_results; }

    uint32_t numberOfVRegs() const { return static_cast<uint32_t>(m_vRegClasses.size()); }
    RegClass vRegClass(uint32_t id) const { assert(id < m_vRegClasses.size()); return m_vRegClasses[id]; }
    // Physical and virtual registers share one dense index space for bit vectors: physical ids come first.
    uint32_t numberOfRegisters() const { return I::physicalRegisterCount() + numberOfVRegs(); }

    const std::string& name() const { return m_name; }
    uint64_t generation() const { return m_generation; }
    bool isCurrent(uint64_t builtAtGeneration) const { return builtAtGeneration == m_generation; }

    // Human-readable listing. Predecessors and successors are annotated when |annotateEdges| is set and a current CFG
    // exists. Not a parseable format.
    std::string toString(bool annotateEdges = false) const {
        std::string text = fmt::format("function {}(", m_name);
        for (size_t i = 0; i < m_arguments.size(); ++i) {
            text += fmt::format("{}{}", i ? ", " : "", regName<I>(m_arguments[i]));
        }
        text += ") -> (";
        for (size_t i = 0; i < m_results.size(); ++i) {
            text += fmt::format("{}{}", i ? ", " : "", regName<I>(m_results[i]));
        }
        text += ")\n";

        bool edges = annotateEdges && hasCFG();
        for (auto block : m_blocks.keys()) {
            text += fmt::format("block{}:", block.index());
            if (edges) {
                text += "  ; preds:";
                for (auto pred : m_cfg->predecessors(block)) {
                    text += fmt::format(" block{}", pred.index());
                }
                text += " succs:";
                for (auto succ : m_cfg->successors(block)) {
                    text += fmt::format(" block{}", succ.index());
                }
            }
            text += "\n";
            for (const auto& inst : m_blocks[block]) {
                text += fmt::format("    {}\n", inst.toString());
            }
        }
        return text;
    }

private:
    void invalidate() { ++m_generation; }

    std::string m_name;
    PrimaryMap<Block, BlockData<I>> m_blocks;
    std::vector<RegClass> m_vRegClasses;
    std::vector<Reg> m_arguments;
    std::vector<Reg> m_results;

    uint64_t m_generation;
    std::unique_ptr<CFG> m_cfg;
    uint64_t m_cfgGeneration;
    std::unique_ptr<DominatorTree> m_domTree;
    uint64_t m_domTreeGeneration;
};

} // namespace tir

#endif // SRC_TIR_FUNCTION_HPP_
