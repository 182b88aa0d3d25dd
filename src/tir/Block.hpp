#ifndef SRC_TIR_BLOCK_HPP_
#define SRC_TIR_BLOCK_HPP_

#include "tir/Arena.hpp"

#include <cassert>
#include <vector>

namespace tir {

struct BlockTag {};
// Handle to a basic block within one Function. Carries no data itself, see BlockData.
using Block = Key<BlockTag, uint32_t>;

// An ordered sequence of instructions. Once the block is complete its last instruction must be a terminator, CFG
// construction checks this.
template <typename I> class BlockData {
public:
    BlockData() = default;
    ~BlockData() = default;

    void push(I inst) { m_insts.emplace_back(std::move(inst)); }

    inline size_t size() const { return m_insts.size(); }
    inline bool empty() const { return m_insts.empty(); }
    const I& at(size_t index) const { assert(index < m_insts.size()); return m_insts[index]; }
    I& at(size_t index) { assert(index < m_insts.size()); return m_insts[index]; }

    // Returns nullptr if the block is empty.
    const I* last() const { return m_insts.empty() ? nullptr : &m_insts.back(); }
    bool isTerminated() const { return m_insts.size() && m_insts.back().isTerminator(); }

    typename std::vector<I>::const_iterator begin() const { return m_insts.begin(); }
    typename std::vector<I>::const_iterator end() const { return m_insts.end(); }
    typename std::vector<I>::iterator begin() { return m_insts.begin(); }
    typename std::vector<I>::iterator end() { return m_insts.end(); }

private:
    std::vector<I> m_insts;
};

} // namespace tir

#endif // SRC_TIR_BLOCK_HPP_
