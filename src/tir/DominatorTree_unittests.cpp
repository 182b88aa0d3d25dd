#include "tir/DominatorTree.hpp"

#include "tir/CFG.hpp"
#include "tir/Validator.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace {

// Builds a graph over |numberOfBlocks| blocks from (from, to) pairs, entry block 0.
tir::CFG makeCFG(size_t numberOfBlocks, const std::vector<std::pair<size_t, size_t>>& edges) {
    tir::CFG cfg(tir::Block(0), numberOfBlocks);
    for (const auto& edge : edges) {
        cfg.addEdge(tir::Block(edge.second), tir::Block(edge.first));
    }
    return cfg;
}

// Dominance must be a partial order over the reachable blocks.
void checkPartialOrder(const tir::CFG& cfg, const tir::DominatorTree& domTree) {
    const auto& blocks = domTree.reversePostorder();
    for (auto a : blocks) {
        CHECK(domTree.dominates(a, a));
        CHECK(domTree.dominates(cfg.entry(), a));
        for (auto b : blocks) {
            if (a != b && domTree.dominates(a, b)) {
                CHECK_FALSE(domTree.dominates(b, a));
            }
            for (auto c : blocks) {
                if (domTree.dominates(a, b) && domTree.dominates(b, c)) {
                    CHECK(domTree.dominates(a, c));
                }
            }
        }
    }
    CHECK(tir::Validator::validateDominatorTree(cfg, domTree));
}

} // namespace

namespace tir {

TEST_CASE("DominatorTree simple") {
    // 0 -> 1, 1 -> 2, 1 -> 3
    auto cfg = makeCFG(4, {{0, 1}, {1, 2}, {1, 3}});
    DominatorTree domTree(cfg);
    CHECK(domTree.dominates(Block(0), Block(1)));
    CHECK(domTree.dominates(Block(0), Block(2)));
    CHECK(domTree.dominates(Block(0), Block(3)));
    CHECK(domTree.dominates(Block(1), Block(2)));
    CHECK(domTree.dominates(Block(1), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(2), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(3), Block(2)));
    CHECK_FALSE(domTree.dominates(Block(1), Block(0)));

    CHECK(domTree.immediateDominator(Block(0)).isNone());
    CHECK_EQ(domTree.immediateDominator(Block(1)), Block(0));
    CHECK_EQ(domTree.immediateDominator(Block(2)), Block(1));
    CHECK_EQ(domTree.immediateDominator(Block(3)), Block(1));
    checkPartialOrder(cfg, domTree);
}

TEST_CASE("DominatorTree diamond") {
    auto cfg = makeCFG(4, {{0, 1}, {0, 2}, {1, 3}, {2, 3}});
    DominatorTree domTree(cfg);
    CHECK(domTree.dominates(Block(0), Block(1)));
    CHECK(domTree.dominates(Block(0), Block(2)));
    CHECK(domTree.dominates(Block(0), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(1), Block(2)));
    CHECK_FALSE(domTree.dominates(Block(2), Block(1)));
    CHECK_FALSE(domTree.dominates(Block(1), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(2), Block(3)));
    CHECK_EQ(domTree.immediateDominator(Block(3)), Block(0));
    checkPartialOrder(cfg, domTree);
}

TEST_CASE("DominatorTree reverse postorder") {
    auto cfg = makeCFG(4, {{0, 1}, {0, 2}, {1, 3}, {2, 3}});
    DominatorTree domTree(cfg);
    const auto& order = domTree.reversePostorder();
    REQUIRE_EQ(order.size(), 4);
    CHECK_EQ(order.front(), Block(0));
    // The join comes after both of its predecessors.
    CHECK_EQ(order.back(), Block(3));
    CHECK_EQ(domTree.rank(Block(0)), 2 * DominatorTree::kStride);
    for (size_t i = 1; i < order.size(); ++i) {
        CHECK_EQ(domTree.rank(order[i]), domTree.rank(order[i - 1]) + DominatorTree::kStride);
    }
    CHECK_EQ(DominatorTree::computeReversePostorder(cfg), order);
}

TEST_CASE("DominatorTree linear chain") {
    std::vector<std::pair<size_t, size_t>> edges;
    for (size_t i = 0; i < 9; ++i) {
        edges.emplace_back(std::make_pair(i, i + 1));
    }
    auto cfg = makeCFG(10, edges);
    DominatorTree domTree(cfg);
    for (size_t i = 0; i < 10; ++i) {
        for (size_t j = 0; j < 10; ++j) {
            CHECK_EQ(domTree.dominates(Block(i), Block(j)), i <= j);
        }
    }
    checkPartialOrder(cfg, domTree);
}

TEST_CASE("DominatorTree loop") {
    // 3 -> 1 is a back edge.
    auto cfg = makeCFG(4, {{0, 1}, {1, 2}, {2, 3}, {3, 1}});
    DominatorTree domTree(cfg);
    for (size_t i = 0; i < 4; ++i) {
        CHECK(domTree.dominates(Block(0), Block(i)));
    }
    CHECK(domTree.dominates(Block(1), Block(2)));
    CHECK(domTree.dominates(Block(1), Block(3)));
    CHECK(domTree.dominates(Block(2), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(3), Block(1)));
    CHECK_FALSE(domTree.dominates(Block(2), Block(1)));
    checkPartialOrder(cfg, domTree);
}

TEST_CASE("DominatorTree cycle through the entry") {
    auto ring = makeCFG(3, {{0, 1}, {1, 2}, {2, 0}});
    DominatorTree ringTree(ring);
    CHECK(ringTree.dominates(Block(0), Block(2)));
    CHECK_FALSE(ringTree.dominates(Block(2), Block(0)));
    CHECK_FALSE(ringTree.dominates(Block(1), Block(0)));
    checkPartialOrder(ring, ringTree);
}

TEST_CASE("DominatorTree nested loops") {
    // Outer loop 1..4 with back edge 4 -> 1, inner loop 2..3 with back edge 3 -> 2, exit 4 -> 5.
    auto cfg = makeCFG(6, {{0, 1}, {1, 2}, {2, 3}, {3, 4}, {4, 5}, {4, 1}, {3, 2}});
    DominatorTree domTree(cfg);
    for (size_t i = 0; i < 6; ++i) {
        CHECK(domTree.dominates(Block(0), Block(i)));
    }
    for (size_t i = 1; i < 6; ++i) {
        CHECK(domTree.dominates(Block(1), Block(i)));
    }
    for (size_t i = 2; i < 6; ++i) {
        CHECK(domTree.dominates(Block(2), Block(i)));
    }
    for (size_t i = 3; i < 6; ++i) {
        CHECK(domTree.dominates(Block(3), Block(i)));
    }
    CHECK(domTree.dominates(Block(4), Block(5)));
    CHECK_FALSE(domTree.dominates(Block(3), Block(2)));
    CHECK_FALSE(domTree.dominates(Block(4), Block(1)));
    CHECK_GE(domTree.iterations(), 1);
    checkPartialOrder(cfg, domTree);
}

TEST_CASE("DominatorTree multiple loops") {
    auto cfg = makeCFG(5, {{0, 1}, {1, 2}, {2, 3}, {3, 4}, {3, 1}, {4, 3}});
    DominatorTree domTree(cfg);
    for (size_t i = 0; i < 5; ++i) {
        CHECK(domTree.dominates(Block(0), Block(i)));
    }
    for (size_t i = 1; i < 5; ++i) {
        CHECK(domTree.dominates(Block(1), Block(i)));
    }
    for (size_t i = 2; i < 5; ++i) {
        CHECK(domTree.dominates(Block(2), Block(i)));
    }
    CHECK(domTree.dominates(Block(3), Block(4)));
    CHECK_FALSE(domTree.dominates(Block(4), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(3), Block(1)));
    checkPartialOrder(cfg, domTree);
}

TEST_CASE("DominatorTree unreachable blocks") {
    // Block 2 is never reached but still has an edge into block 3.
    auto cfg = makeCFG(4, {{0, 1}, {1, 3}, {2, 3}});
    DominatorTree domTree(cfg);
    CHECK(domTree.isReachable(Block(0)));
    CHECK_FALSE(domTree.isReachable(Block(2)));
    CHECK_EQ(domTree.rank(Block(2)), 0);
    CHECK(domTree.immediateDominator(Block(2)).isNone());
    CHECK_FALSE(domTree.dominates(Block(2), Block(3)));
    CHECK_FALSE(domTree.dominates(Block(0), Block(2)));
    CHECK(domTree.dominates(Block(1), Block(3)));
    CHECK_EQ(domTree.reversePostorder().size(), 3);
    checkPartialOrder(cfg, domTree);
}

} // namespace tir
