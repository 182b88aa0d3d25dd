#ifndef SRC_TIR_BIT_SET_HPP_
#define SRC_TIR_BIT_SET_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tir {

// Fixed-universe set of small non-negative integers, stored as an array of machine words. The universe is rounded up
// to a whole number of words at construction. Binary operations require both sets to have the same number of words.
class BitSet {
public:
    using Word = uint64_t;
    static constexpr size_t kBitsPerWord = sizeof(Word) * 8;

    BitSet() = default;
    explicit BitSet(size_t size);
    ~BitSet() = default;

    static BitSet zeroes(size_t size) { return BitSet(size); }
    // Every bit within |size| is set, the padding bits of the last word remain clear.
    static BitSet ones(size_t size);

    void add(size_t index);
    void remove(size_t index);
    // Out-of-range queries return false.
    bool has(size_t index) const;
    void clear();

    // In-place set algebra, returns true if the set changed.
    bool unionWith(const BitSet& other);
    bool intersectWith(const BitSet& other);
    bool subtract(const BitSet& other);

    size_t count() const;
    bool empty() const { return count() == 0; }
    bool operator==(const BitSet& other) const { return m_words == other.m_words; }
    bool operator!=(const BitSet& other) const { return m_words != other.m_words; }

    // Set and unset positions within the (rounded) universe, in ascending order.
    std::vector<size_t> ones() const;
    std::vector<size_t> zeroes() const;

    // Calls |func(index)| for each set bit in ascending order.
    template <typename F> void forEachOne(F func) const {
        for (size_t i = 0; i < m_words.size(); ++i) {
            Word word = m_words[i];
            while (word) {
                size_t bit = static_cast<size_t>(__builtin_ctzll(word));
                func(i * kBitsPerWord + bit);
                word &= word - 1;
            }
        }
    }

    // Number of bits addressable, always a multiple of kBitsPerWord.
    size_t capacity() const { return m_words.size() * kBitsPerWord; }

    std::string toString() const;

private:
    std::vector<Word> m_words;
};

} // namespace tir

#endif // SRC_TIR_BIT_SET_HPP_
