#ifndef SRC_TIR_CFG_HPP_
#define SRC_TIR_CFG_HPP_

#include "tir/Arena.hpp"
#include "tir/Block.hpp"

#include <vector>

namespace tir {

// Control flow graph over the blocks of one function. Edges are stored on both ends, so that the successor list of
// the source and the predecessor list of the target always agree. The graph is built once and never updated, any
// change to the blocks it was built from requires a rebuild.
class CFG {
public:
    CFG() = default;
    CFG(Block entry, size_t numberOfBlocks);
    ~CFG() = default;

    // Adds the edge |predecessor| -> |successor|.
    void addEdge(Block successor, Block predecessor);

    const std::vector<Block>& predecessors(Block block) const { return m_nodes[block].predecessors; }
    const std::vector<Block>& successors(Block block) const { return m_nodes[block].successors; }
    bool hasEdge(Block from, Block to) const;

    inline Block entry() const { return m_entry; }
    // Size of the block key space, which includes any freed block slots.
    inline size_t numberOfBlocks() const { return m_nodes.capacity(); }
    size_t numberOfEdges() const;

private:
    struct Node {
        std::vector<Block> successors;
        std::vector<Block> predecessors;
    };

    SecondaryMap<Block, Node> m_nodes;
    Block m_entry;
};

} // namespace tir

#endif // SRC_TIR_CFG_HPP_
