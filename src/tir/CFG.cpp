#include "tir/CFG.hpp"

#include <algorithm>

namespace tir {

CFG::CFG(Block entry, size_t numberOfBlocks): m_nodes(numberOfBlocks), m_entry(entry) {
    assert(entry.index() < numberOfBlocks);
}

void CFG::addEdge(Block successor, Block predecessor) {
    m_nodes[successor].predecessors.emplace_back(predecessor);
    m_nodes[predecessor].successors.emplace_back(successor);
}

bool CFG::hasEdge(Block from, Block to) const {
    const auto& succs = m_nodes[from].successors;
    return std::find(succs.begin(), succs.end(), to) != succs.end();
}

size_t CFG::numberOfEdges() const {
    size_t edges = 0;
    for (size_t i = 0; i < m_nodes.capacity(); ++i) {
        edges += m_nodes[Block(i)].successors.size();
    }
    return edges;
}

} // namespace tir
