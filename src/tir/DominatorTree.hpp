#ifndef SRC_TIR_DOMINATOR_TREE_HPP_
#define SRC_TIR_DOMINATOR_TREE_HPP_

#include "tir/Arena.hpp"
#include "tir/Block.hpp"

#include <cstdint>
#include <vector>

namespace tir {

class CFG;

// Dominator tree computed with the iterative algorithm from "A Simple, Fast Dominance Algorithm" by K. Cooper,
// T. Harvey and K. Kennedy. Blocks are ranked in reverse postorder, and ranks are spaced by kStride so that a future
// renumbering can slot blocks in between without recomputing the whole order. A rank of zero marks a block not
// reachable from the entry.
class DominatorTree {
public:
    static constexpr uint32_t kStride = 4;

    DominatorTree() = delete;
    explicit DominatorTree(const CFG& cfg);
    ~DominatorTree() = default;

    // True if every path from the entry to |b| passes through |a|. Every block dominates itself.
    bool dominates(Block a, Block b) const;

    // Returns Block::none() for the entry and for unreachable blocks.
    Block immediateDominator(Block block) const { return m_nodes[block].idom; }
    bool isReachable(Block block) const { return m_nodes[block].rpo > 0; }
    uint32_t rank(Block block) const { return m_nodes[block].rpo; }
    const std::vector<Block>& reversePostorder() const { return m_reversePostorder; }
    // Number of passes the fixed point took to settle, including the final unchanged pass.
    int iterations() const { return m_iterations; }

    // Reverse postorder of the blocks reachable from the entry of |cfg|, computed with an explicit stack.
    static std::vector<Block> computeReversePostorder(const CFG& cfg);

private:
    struct Node {
        uint32_t rpo = 0;
        Block idom;
    };

    Block computeIdom(Block block, const CFG& cfg) const;
    Block commonDominator(Block a, Block b) const;

    SecondaryMap<Block, Node> m_nodes;
    std::vector<Block> m_reversePostorder;
    int m_iterations;
};

} // namespace tir

#endif // SRC_TIR_DOMINATOR_TREE_HPP_
