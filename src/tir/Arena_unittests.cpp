#include "tir/Arena.hpp"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace {

struct WidgetTag {};
using Widget = tir::Key<WidgetTag>;

} // namespace

namespace tir {

TEST_CASE("Key") {
    Widget none;
    CHECK(none.isNone());
    CHECK_EQ(none, Widget::none());
    Widget three(3);
    CHECK_FALSE(three.isNone());
    CHECK_EQ(three.index(), 3);
    CHECK_NE(three, Widget(4));
    CHECK(three < Widget(4));
}

TEST_CASE("PrimaryMap") {
    PrimaryMap<Widget, std::string> map;
    CHECK(map.empty());

    SUBCASE("insert and index") {
        auto a = map.insert("a");
        auto b = map.insert("b");
        auto c = map.insert("c");
        CHECK_EQ(a.index(), 0);
        CHECK_EQ(b.index(), 1);
        CHECK_EQ(c.index(), 2);
        CHECK_EQ(map.size(), 3);
        CHECK_EQ(map[b], "b");
        map[b] = "bee";
        CHECK_EQ(map[b], "bee");
        CHECK(map.contains(c));
        CHECK_FALSE(map.contains(Widget(3)));
        CHECK_FALSE(map.contains(Widget::none()));
    }

    SUBCASE("erase reuses the freed slot") {
        auto a = map.insert("a");
        auto b = map.insert("b");
        map.insert("c");
        map.erase(b);
        CHECK_FALSE(map.contains(b));
        CHECK_EQ(map.size(), 2);
        CHECK_EQ(map.capacity(), 3);
        CHECK_EQ(map.keys(), std::vector<Widget>{a, Widget(2)});

        auto d = map.insert("d");
        CHECK_EQ(d, b);
        CHECK_EQ(map[d], "d");
        CHECK_EQ(map.capacity(), 3);
    }

    SUBCASE("forEach visits live entries in key order") {
        map.insert("a");
        auto b = map.insert("b");
        map.insert("c");
        map.erase(b);
        std::string visited;
        map.forEach([&visited](Widget key, const std::string& value) {
            visited += std::to_string(key.index()) + value;
        });
        CHECK_EQ(visited, "0a2c");
    }
}

TEST_CASE("SecondaryMap") {
    SUBCASE("pre-sized with fill") {
        SecondaryMap<Widget, int> map(4, -1);
        CHECK_EQ(map.capacity(), 4);
        CHECK_EQ(map[Widget(3)], -1);
        map[Widget(2)] = 7;
        CHECK_EQ(map[Widget(2)], 7);
    }

    SUBCASE("insert grows") {
        SecondaryMap<Widget, int> map;
        CHECK_EQ(map.capacity(), 0);
        map.insert(Widget(5), 9);
        CHECK_EQ(map.capacity(), 6);
        CHECK_EQ(map[Widget(5)], 9);
        CHECK_EQ(map[Widget(0)], 0);
        map.resize(8, 3);
        CHECK_EQ(map[Widget(7)], 3);
        CHECK_EQ(map[Widget(5)], 9);
    }
}

} // namespace tir
