#ifndef SRC_TIR_CFG_BUILDER_HPP_
#define SRC_TIR_CFG_BUILDER_HPP_

#include "tir/Block.hpp"
#include "tir/CFG.hpp"
#include "tir/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <memory>
#include <string>
#include <vector>

namespace tir {

// Derives the control flow graph of a function from the terminators of its blocks, in one linear pass over blocks
// and edges. The entry block is block 0.
class CFGBuilder {
public:
    CFGBuilder() = delete;
    explicit CFGBuilder(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) {}
    ~CFGBuilder() = default;

    // Returns nullptr and reports the error if the function has no blocks or any block lacks a terminator.
    template <typename I>
    std::unique_ptr<CFG> build(const std::string& functionName, const PrimaryMap<Block, BlockData<I>>& blocks) {
        if (blocks.empty()) {
            m_errorReporter->addEmptyFunctionBodyError(functionName);
            return nullptr;
        }

        // Check every block before building anything, so failure leaves no partial graph behind.
        for (auto block : blocks.keys()) {
            if (!blocks[block].isTerminated()) {
                m_errorReporter->addBlockNotTerminatedError(functionName, block);
                return nullptr;
            }
        }

        auto cfg = std::make_unique<CFG>(Block(0), blocks.capacity());
        for (auto block : blocks.keys()) {
            const I* terminator = blocks[block].last();
            if (!terminator->isBranch()) {
                continue;
            }
            // Successors keep the order of the branch targets, taken before not taken. A target repeated within one
            // branch contributes a single edge.
            std::vector<Block> targets;
            for (auto target : terminator->branchTargets()) {
                assert(blocks.contains(target));
                if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
                    targets.emplace_back(target);
                    cfg->addEdge(target, block);
                }
            }
        }

        SPDLOG_DEBUG("Built CFG for '{}' with {} blocks and {} edges", functionName, blocks.size(),
                     cfg->numberOfEdges());
        return cfg;
    }

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace tir

#endif // SRC_TIR_CFG_BUILDER_HPP_
