#ifndef SRC_TIR_LIVE_RANGE_HPP_
#define SRC_TIR_LIVE_RANGE_HPP_

#include "tir/Block.hpp"
#include "tir/Register.hpp"

#include <cassert>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tir {

// A position in a function: instruction |index| of |block|. Points are ordered by block layout order first, which is
// block key order, then by index. An index equal to the block length names the end of the block, after its
// terminator.
struct ProgramPoint {
    ProgramPoint() = default;
    ProgramPoint(Block b, uint32_t i): block(b), index(i) {}
    ~ProgramPoint() = default;

    bool operator==(const ProgramPoint& p) const { return block == p.block && index == p.index; }
    bool operator!=(const ProgramPoint& p) const { return !(*this == p); }
    bool operator<(const ProgramPoint& p) const {
        return block.index() < p.block.index() || (block == p.block && index < p.index);
    }
    bool operator<=(const ProgramPoint& p) const { return !(p < *this); }
    bool operator>(const ProgramPoint& p) const { return p < *this; }
    bool operator>=(const ProgramPoint& p) const { return !(*this < p); }

    std::string toString() const;

    Block block;
    uint32_t index = 0;
};

// A span of program points over which |reg| holds a value that must be preserved. Both ends are inclusive.
struct LiveRange {
    LiveRange() = default;
    LiveRange(Reg r, ProgramPoint s, ProgramPoint e): reg(r), start(s), end(e) { assert(s <= e); }
    ~LiveRange() = default;

    bool covers(const ProgramPoint& p) const { return start <= p && p <= end; }
    bool overlaps(const LiveRange& r) const { return start <= r.end && r.start <= end; }

    bool operator==(const LiveRange& r) const { return reg == r.reg && start == r.start && end == r.end; }

    std::string toString() const;

    Reg reg;
    ProgramPoint start;
    ProgramPoint end;
};

// All the live ranges of one register, kept sorted by start and free of overlaps. The linear scan literature calls a
// collection like this a lifetime interval, and the gaps between ranges lifetime holes.
class LiveInterval {
public:
    // Decides whether a range ending at the first point and a range starting at the second point touch, even though
    // the points differ. Used for ranges that meet at a block boundary.
    using ContiguityPredicate = std::function<bool(const ProgramPoint& end, const ProgramPoint& nextStart)>;

    LiveInterval() = default;
    explicit LiveInterval(Reg r): m_reg(r) {}
    ~LiveInterval() = default;

    // Adds [start, end] in sorted order, merging it with any ranges it overlaps.
    void addRange(ProgramPoint start, ProgramPoint end);

    // Merges each pair of neighboring ranges the predicate deems contiguous.
    void coalesce(const ContiguityPredicate& isContiguous);

    bool covers(const ProgramPoint& p) const;
    // True if any range intersects the inclusive span [from, to].
    bool intersects(const ProgramPoint& from, const ProgramPoint& to) const;

    bool isEmpty() const { return m_ranges.empty(); }
    const ProgramPoint& start() const { assert(!isEmpty()); return m_ranges.front().start; }
    const ProgramPoint& end() const { assert(!isEmpty()); return m_ranges.back().end; }
    Reg reg() const { return m_reg; }
    const std::vector<LiveRange>& ranges() const { return m_ranges; }

private:
    Reg m_reg;
    std::vector<LiveRange> m_ranges;
};

} // namespace tir

#endif // SRC_TIR_LIVE_RANGE_HPP_
