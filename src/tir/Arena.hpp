#ifndef SRC_TIR_ARENA_HPP_
#define SRC_TIR_ARENA_HPP_

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace tir {

// Opaque handle into a PrimaryMap. |Tag| keeps keys for different entity types from being mixed up at compile time,
// and the maximum |Index| value is reserved as the "none" sentinel.
template <typename Tag, typename Index = uint32_t> class Key {
public:
    using IndexType = Index;

    Key(): m_index(kNoneIndex) {}
    explicit Key(size_t index): m_index(static_cast<Index>(index)) { assert(index < kNoneIndex); }
    ~Key() = default;

    static Key none() { return Key(); }

    inline size_t index() const { assert(!isNone()); return static_cast<size_t>(m_index); }
    inline bool isNone() const { return m_index == kNoneIndex; }

    bool operator==(const Key& k) const { return m_index == k.m_index; }
    bool operator!=(const Key& k) const { return m_index != k.m_index; }
    bool operator<(const Key& k) const { return m_index < k.m_index; }

private:
    static constexpr Index kNoneIndex = std::numeric_limits<Index>::max();
    Index m_index;
};

// Dense, append-mostly owning store. Keys handed out by insert() stay valid until erase(), and iteration visits live
// entries in ascending key order.
template <typename K, typename V> class PrimaryMap {
public:
    PrimaryMap() = default;
    ~PrimaryMap() = default;

    K insert(V value) {
        if (m_freeList.size()) {
            auto key = m_freeList.back();
            m_freeList.pop_back();
            assert(!m_values[key.index()]);
            m_values[key.index()].emplace(std::move(value));
            return key;
        }
        m_values.emplace_back(std::move(value));
        return K(m_values.size() - 1);
    }

    // Frees the slot at |key|, which may then be handed out again by insert().
    void erase(K key) {
        assert(contains(key));
        m_values[key.index()].reset();
        m_freeList.emplace_back(key);
    }

    bool contains(K key) const { return !key.isNone() && key.index() < m_values.size() && m_values[key.index()]; }

    V& operator[](K key) {
        assert(contains(key));
        return *m_values[key.index()];
    }
    const V& operator[](K key) const {
        assert(contains(key));
        return *m_values[key.index()];
    }

    // Number of live entries.
    size_t size() const { return m_values.size() - m_freeList.size(); }
    // Size of the key space, including freed slots. SecondaryMaps keyed on this map should be sized to capacity().
    size_t capacity() const { return m_values.size(); }
    bool empty() const { return size() == 0; }

    // Calls |func(key, value)| on each live entry in ascending key order.
    void forEach(const std::function<void(K, const V&)>& func) const {
        for (size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i]) { func(K(i), *m_values[i]); }
        }
    }

    // Returns the live keys in ascending order.
    std::vector<K> keys() const {
        std::vector<K> liveKeys;
        liveKeys.reserve(size());
        for (size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i]) { liveKeys.emplace_back(K(i)); }
        }
        return liveKeys;
    }

private:
    std::vector<std::optional<V>> m_values;
    std::vector<K> m_freeList;
};

// Auxiliary per-entity storage indexed by keys from a PrimaryMap. Indexing past the current size is a programmer
// error, callers must size the map to the owning PrimaryMap's capacity() before use or grow it with insert().
template <typename K, typename V> class SecondaryMap {
public:
    SecondaryMap() = default;
    SecondaryMap(size_t size, const V& fill): m_values(size, fill) {}
    explicit SecondaryMap(size_t size): m_values(size) {}
    ~SecondaryMap() = default;

    // Stores |value| at |key|, growing the map with default values as needed.
    K insert(K key, V value) {
        if (m_values.size() <= key.index()) {
            m_values.resize(key.index() + 1);
        }
        m_values[key.index()] = std::move(value);
        return key;
    }

    void resize(size_t size, const V& fill) { m_values.resize(size, fill); }

    V& operator[](K key) {
        assert(key.index() < m_values.size());
        return m_values[key.index()];
    }
    const V& operator[](K key) const {
        assert(key.index() < m_values.size());
        return m_values[key.index()];
    }

    size_t capacity() const { return m_values.size(); }

private:
    std::vector<V> m_values;
};

} // namespace tir

#endif // SRC_TIR_ARENA_HPP_
