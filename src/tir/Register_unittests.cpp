#include "tir/Register.hpp"

#include "doctest/doctest.h"

#include <array>

namespace tir {

TEST_CASE("Reg encoding") {
    SUBCASE("default is invalid") {
        Reg reg;
        CHECK(!reg.isValid());
        CHECK(!reg.isVirtual());
        CHECK(!reg.isPhysical());
        CHECK(!reg.isSpill());
        CHECK_EQ(reg.bits(), Reg::kInvalid);
    }

    SUBCASE("round trip for every storage type, kind and width") {
        std::array<Reg::Type, 3> types = {Reg::kVirtual, Reg::kPhysical, Reg::kSpill};
        std::array<RegClass::Kind, 3> kinds = {RegClass::kInt, RegClass::kFloat, RegClass::kVec};
        std::array<uint32_t, 4> ids = {0, 1, 4097, Reg::kMaxId};
        for (auto type : types) {
            for (auto kind : kinds) {
                for (uint32_t width = 1; width <= (1u << 15); width <<= 1) {
                    for (auto id : ids) {
                        Reg reg(type, RegClass(kind, width), id);
                        REQUIRE(reg.isValid());
                        CHECK_EQ(reg.type(), type);
                        CHECK_EQ(reg.regClass().kind, kind);
                        CHECK_EQ(reg.regClass().width, width);
                        CHECK_EQ(reg.id(), id);
                    }
                }
            }
        }
    }

    SUBCASE("storage type predicates") {
        auto v = Reg::virt(RegClass::integer(8), 3);
        auto p = Reg::physical(RegClass::integer(8), 3);
        auto s = Reg::spill(RegClass::integer(8), 3);
        CHECK(v.isVirtual());
        CHECK(p.isPhysical());
        CHECK(s.isSpill());
        CHECK(v != p);
        CHECK(p != s);
        CHECK(v != s);
    }

    SUBCASE("width is part of the register") {
        auto rax = Reg::physical(RegClass::integer(8), 0);
        auto eax = Reg::physical(RegClass::integer(4), 0);
        CHECK(rax != eax);
        CHECK_EQ(rax.id(), eax.id());
    }
}

TEST_CASE("RegClass") {
    CHECK(RegClass::isValidWidth(1));
    CHECK(RegClass::isValidWidth(16));
    CHECK(!RegClass::isValidWidth(0));
    CHECK(!RegClass::isValidWidth(3));
    CHECK(!RegClass::isValidWidth(12));
    CHECK_EQ(RegClass::integer(8).toString(), "i64");
    CHECK_EQ(RegClass::floating(4).toString(), "f32");
    CHECK_EQ(RegClass::vector(16).toString(), "v16x8");
    CHECK(RegClass::integer(4) != RegClass::integer(8));
    CHECK(RegClass::integer(4) != RegClass::floating(4));
}

} // namespace tir
