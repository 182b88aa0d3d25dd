#include "tir/LiveRange.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace tir {

std::string ProgramPoint::toString() const {
    return fmt::format("(block{}, {})", block.index(), index);
}

std::string LiveRange::toString() const {
    return fmt::format("[{}, {}]", start.toString(), end.toString());
}

void LiveInterval::addRange(ProgramPoint start, ProgramPoint end) {
    assert(start <= end);

    // Skip past every range that ends strictly before |start|.
    auto fromIter = m_ranges.begin();
    while (fromIter != m_ranges.end() && fromIter->end < start) {
        ++fromIter;
    }

    if (fromIter == m_ranges.end() || end < fromIter->start) {
        m_ranges.emplace(fromIter, LiveRange(m_reg, start, end));
        return;
    }

    // |fromIter| overlaps the new range, absorb it along with every later range the new one reaches into.
    fromIter->start = std::min(fromIter->start, start);
    fromIter->end = std::max(fromIter->end, end);
    auto toIter = fromIter + 1;
    while (toIter != m_ranges.end() && toIter->start <= fromIter->end) {
        fromIter->end = std::max(fromIter->end, toIter->end);
        ++toIter;
    }
    m_ranges.erase(fromIter + 1, toIter);
}

void LiveInterval::coalesce(const ContiguityPredicate& isContiguous) {
    if (m_ranges.size() < 2) {
        return;
    }

    std::vector<LiveRange> merged;
    merged.reserve(m_ranges.size());
    merged.emplace_back(m_ranges.front());
    for (size_t i = 1; i < m_ranges.size(); ++i) {
        auto& last = merged.back();
        const auto& range = m_ranges[i];
        if (range.start <= last.end || isContiguous(last.end, range.start)) {
            last.end = std::max(last.end, range.end);
        } else {
            merged.emplace_back(range);
        }
    }
    m_ranges.swap(merged);
}

bool LiveInterval::covers(const ProgramPoint& p) const {
    if (isEmpty() || p < start() || end() < p) {
        return false;
    }

    for (const auto& range : m_ranges) {
        if (range.covers(p)) {
            return true;
        } else if (p < range.start) {
            return false;
        }
    }

    return false;
}

bool LiveInterval::intersects(const ProgramPoint& from, const ProgramPoint& to) const {
    for (const auto& range : m_ranges) {
        if (to < range.start) {
            return false;
        }
        if (from <= range.end) {
            return true;
        }
    }
    return false;
}

} // namespace tir
