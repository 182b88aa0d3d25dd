#include "tir/DominatorTree.hpp"

#include "tir/BitSet.hpp"
#include "tir/CFG.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <utility>

namespace tir {

DominatorTree::DominatorTree(const CFG& cfg): m_nodes(cfg.numberOfBlocks()), m_iterations(0) {
    m_reversePostorder = computeReversePostorder(cfg);
    if (m_reversePostorder.empty()) {
        return;
    }

    // The entry gets rank 2 * kStride, leaving room below it. Unreachable blocks keep rank 0.
    for (size_t i = 0; i < m_reversePostorder.size(); ++i) {
        m_nodes[m_reversePostorder[i]].rpo = static_cast<uint32_t>(i + 2) * kStride;
    }

    bool changed = true;
    while (changed) {
        changed = false;
        ++m_iterations;
        // Skip the entry, it has no immediate dominator.
        for (size_t i = 1; i < m_reversePostorder.size(); ++i) {
            auto block = m_reversePostorder[i];
            auto newIdom = computeIdom(block, cfg);
            if (m_nodes[block].idom != newIdom) {
                m_nodes[block].idom = newIdom;
                changed = true;
            }
        }
    }

    SPDLOG_DEBUG("Dominator tree over {} reachable blocks settled after {} iterations", m_reversePostorder.size(),
                 m_iterations);
}

bool DominatorTree::dominates(Block a, Block b) const {
    if (a == b) {
        return true;
    }

    auto aRank = m_nodes[a].rpo;
    if (aRank == 0) {
        return false;
    }

    while (m_nodes[b].rpo > aRank) {
        auto idom = m_nodes[b].idom;
        if (idom.isNone()) {
            return false;
        }
        b = idom;
    }

    return a == b;
}

// static
std::vector<Block> DominatorTree::computeReversePostorder(const CFG& cfg) {
    std::vector<Block> postorder;
    if (cfg.numberOfBlocks() == 0) {
        return postorder;
    }
    postorder.reserve(cfg.numberOfBlocks());

    BitSet visited(cfg.numberOfBlocks());
    // Each frame is a block and the index of the next successor to visit.
    std::vector<std::pair<Block, size_t>> stack;
    stack.emplace_back(std::make_pair(cfg.entry(), 0));
    visited.add(cfg.entry().index());

    while (stack.size()) {
        auto block = stack.back().first;
        auto next = stack.back().second;
        const auto& succs = cfg.successors(block);
        if (next < succs.size()) {
            ++stack.back().second;
            auto succ = succs[next];
            if (!visited.has(succ.index())) {
                visited.add(succ.index());
                stack.emplace_back(std::make_pair(succ, 0));
            }
        } else {
            postorder.emplace_back(block);
            stack.pop_back();
        }
    }

    std::reverse(postorder.begin(), postorder.end());
    return postorder;
}

Block DominatorTree::computeIdom(Block block, const CFG& cfg) const {
    auto entry = m_reversePostorder.front();
    Block idom;
    for (auto pred : cfg.predecessors(block)) {
        // Only predecessors already processed this pass, or in a previous one, take part.
        if (m_nodes[pred].rpo == 0 || (pred != entry && m_nodes[pred].idom.isNone())) {
            continue;
        }
        idom = idom.isNone() ? pred : commonDominator(idom, pred);
    }
    // A reachable block always has its DFS parent ahead of it in reverse postorder.
    assert(!idom.isNone());
    return idom;
}

Block DominatorTree::commonDominator(Block a, Block b) const {
    while (a != b) {
        while (m_nodes[a].rpo > m_nodes[b].rpo) {
            a = m_nodes[a].idom;
        }
        while (m_nodes[b].rpo > m_nodes[a].rpo) {
            b = m_nodes[b].idom;
        }
    }
    return a;
}

} // namespace tir
