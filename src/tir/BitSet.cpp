#include "tir/BitSet.hpp"

#include "fmt/format.h"

#include <cassert>

namespace tir {

BitSet::BitSet(size_t size): m_words((size + kBitsPerWord - 1) / kBitsPerWord, 0) {}

// static
BitSet BitSet::ones(size_t size) {
    BitSet set(size);
    for (auto& word : set.m_words) {
        word = ~Word(0);
    }
    size_t tail = size % kBitsPerWord;
    if (tail) {
        set.m_words.back() = (Word(1) << tail) - 1;
    }
    return set;
}

void BitSet::add(size_t index) {
    assert(index < capacity());
    m_words[index / kBitsPerWord] |= Word(1) << (index % kBitsPerWord);
}

void BitSet::remove(size_t index) {
    assert(index < capacity());
    m_words[index / kBitsPerWord] &= ~(Word(1) << (index % kBitsPerWord));
}

bool BitSet::has(size_t index) const {
    if (index >= capacity()) {
        return false;
    }
    return (m_words[index / kBitsPerWord] & (Word(1) << (index % kBitsPerWord))) != 0;
}

void BitSet::clear() {
    for (auto& word : m_words) {
        word = 0;
    }
}

bool BitSet::unionWith(const BitSet& other) {
    assert(m_words.size() == other.m_words.size());
    bool changed = false;
    for (size_t i = 0; i < m_words.size(); ++i) {
        Word merged = m_words[i] | other.m_words[i];
        changed |= (merged != m_words[i]);
        m_words[i] = merged;
    }
    return changed;
}

bool BitSet::intersectWith(const BitSet& other) {
    assert(m_words.size() == other.m_words.size());
    bool changed = false;
    for (size_t i = 0; i < m_words.size(); ++i) {
        Word merged = m_words[i] & other.m_words[i];
        changed |= (merged != m_words[i]);
        m_words[i] = merged;
    }
    return changed;
}

bool BitSet::subtract(const BitSet& other) {
    assert(m_words.size() == other.m_words.size());
    bool changed = false;
    for (size_t i = 0; i < m_words.size(); ++i) {
        Word merged = m_words[i] & ~other.m_words[i];
        changed |= (merged != m_words[i]);
        m_words[i] = merged;
    }
    return changed;
}

size_t BitSet::count() const {
    size_t total = 0;
    for (auto word : m_words) {
        total += static_cast<size_t>(__builtin_popcountll(word));
    }
    return total;
}

std::vector<size_t> BitSet::ones() const {
    std::vector<size_t> positions;
    forEachOne([&positions](size_t index) { positions.emplace_back(index); });
    return positions;
}

std::vector<size_t> BitSet::zeroes() const {
    std::vector<size_t> positions;
    for (size_t i = 0; i < m_words.size(); ++i) {
        Word word = ~m_words[i];
        while (word) {
            size_t bit = static_cast<size_t>(__builtin_ctzll(word));
            positions.emplace_back(i * kBitsPerWord + bit);
            word &= word - 1;
        }
    }
    return positions;
}

std::string BitSet::toString() const {
    std::string result = "{";
    bool first = true;
    forEachOne([&result, &first](size_t index) {
        if (!first) { result += ", "; }
        result += fmt::format("{}", index);
        first = false;
    });
    result += "}";
    return result;
}

} // namespace tir
