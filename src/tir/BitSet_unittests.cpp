#include "tir/BitSet.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace tir {

TEST_CASE("BitSet basics") {
    SUBCASE("size rounds up to word granularity") {
        BitSet bs(100);
        CHECK_EQ(bs.count(), 0);
        CHECK_EQ(bs.capacity(), 128);
        BitSet empty(0);
        CHECK_EQ(empty.capacity(), 0);
        CHECK(!empty.has(0));
    }

    SUBCASE("add and has") {
        BitSet bs(128);
        bs.add(0);
        bs.add(63);
        bs.add(64);
        bs.add(127);
        CHECK(bs.has(0));
        CHECK(bs.has(63));
        CHECK(bs.has(64));
        CHECK(bs.has(127));
        CHECK(!bs.has(1));
        CHECK(!bs.has(62));
        CHECK(!bs.has(126));
        // Out-of-range queries are not errors.
        CHECK(!bs.has(128));
        CHECK(!bs.has(100000));
        CHECK_EQ(bs.count(), 4);
    }

    SUBCASE("remove") {
        BitSet bs(40);
        bs.add(10);
        CHECK(bs.has(10));
        bs.remove(10);
        CHECK(!bs.has(10));
        // Removing an absent bit changes nothing.
        bs.remove(11);
        CHECK(bs.empty());
    }

    SUBCASE("clear") {
        BitSet bs(70);
        bs.add(3);
        bs.add(69);
        bs.clear();
        CHECK(bs.empty());
        CHECK(bs == BitSet(70));
    }

    SUBCASE("ones respects the universe") {
        auto bs = BitSet::ones(70);
        CHECK_EQ(bs.count(), 70);
        CHECK(bs.has(69));
        CHECK(!bs.has(70));
        CHECK(BitSet::zeroes(70).empty());
    }
}

TEST_CASE("BitSet algebra") {
    BitSet a(64);
    BitSet b(64);
    a.add(1);
    a.add(2);
    b.add(2);
    b.add(3);

    SUBCASE("union") {
        CHECK(a.unionWith(b));
        CHECK(a.has(1));
        CHECK(a.has(2));
        CHECK(a.has(3));
        CHECK_EQ(a.count(), 3);
        // A second union is a no-op.
        CHECK(!a.unionWith(b));
    }

    SUBCASE("intersect") {
        CHECK(a.intersectWith(b));
        CHECK(!a.has(1));
        CHECK(a.has(2));
        CHECK(!a.has(3));
        CHECK_EQ(a.count(), 1);
    }

    SUBCASE("difference") {
        CHECK(a.subtract(b));
        CHECK(a.has(1));
        CHECK(!a.has(2));
        CHECK(!a.has(3));
        CHECK(!a.subtract(b));
    }

    SUBCASE("equals") {
        BitSet c(64);
        BitSet d(64);
        CHECK(c == d);
        c.add(5);
        CHECK(c != d);
        d.add(5);
        CHECK(c == d);
        c.add(10);
        d.add(11);
        CHECK(c != d);
        // Different universe sizes never compare equal.
        CHECK(BitSet(64) != BitSet(128));
    }
}

TEST_CASE("BitSet iteration") {
    BitSet bs(128);
    bs.add(1);
    bs.add(3);
    bs.add(64);

    SUBCASE("ones ascending") {
        CHECK(bs.ones() == std::vector<size_t>({1, 3, 64}));
        std::vector<size_t> visited;
        bs.forEachOne([&visited](size_t i) { visited.emplace_back(i); });
        CHECK(visited == std::vector<size_t>({1, 3, 64}));
    }

    SUBCASE("zeroes ascending") {
        auto zeroes = bs.zeroes();
        REQUIRE_EQ(zeroes.size(), 125);
        CHECK_EQ(zeroes[0], 0);
        CHECK_EQ(zeroes[1], 2);
        CHECK_EQ(zeroes[2], 4);
        CHECK_EQ(zeroes.back(), 127);
    }

    SUBCASE("toString") {
        CHECK_EQ(bs.toString(), "{1, 3, 64}");
        CHECK_EQ(BitSet(8).toString(), "{}");
    }
}

} // namespace tir
