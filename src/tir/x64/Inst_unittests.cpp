#include "tir/x64/Inst.hpp"

#include "tir/Inst.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace tir {
namespace x64 {

TEST_CASE("x64 register names") {
    CHECK_EQ(registerName(gpr(kRAX)), "rax");
    CHECK_EQ(registerName(gpr(kRAX, 4)), "eax");
    CHECK_EQ(registerName(gpr(kRAX, 2)), "ax");
    CHECK_EQ(registerName(gpr(kRAX, 1)), "al");
    CHECK_EQ(registerName(gpr(kRSI, 1)), "sil");
    CHECK_EQ(registerName(gpr(kRDI)), "rdi");
    CHECK_EQ(registerName(gpr(kR8)), "r8");
    CHECK_EQ(registerName(gpr(kR11, 4)), "r11d");
    CHECK_EQ(registerName(gpr(kR15, 2)), "r15w");
    CHECK_EQ(registerName(gpr(kR12, 1)), "r12b");
    CHECK_EQ(registerName(xmm(0)), "xmm0");
    CHECK_EQ(registerName(xmm(15)), "xmm15");

    CHECK_EQ(physicalRegister(kRBX), gpr(kRBX));
    CHECK_EQ(physicalRegister(kXMM0 + 3), xmm(3));
    CHECK(isGeneralRegister(kR15));
    CHECK_FALSE(isGeneralRegister(kXMM0));
    CHECK(Inst::isReservedRegister(kRSP));
    CHECK(Inst::isReservedRegister(kRBP));
    CHECK_FALSE(Inst::isReservedRegister(kRAX));
    CHECK_EQ(Inst::physicalRegisterCount(), 32);
}

TEST_CASE("x64 Inst uses and defs") {
    auto v0 = Reg::virt(RegClass::integer(8), 0);
    auto v1 = Reg::virt(RegClass::integer(8), 1);

    SUBCASE("mov") {
        auto mov = Inst::movRR(v0, v1);
        CHECK_EQ(mov.uses(), std::vector<Reg>{v1});
        CHECK_EQ(mov.defs(), std::vector<Reg>{v0});
        auto imm = Inst::movRI(v0, 42);
        CHECK(imm.uses().empty());
        CHECK_EQ(imm.defs(), std::vector<Reg>{v0});
    }

    SUBCASE("two-address arithmetic reads its destination") {
        auto add = Inst::add(v0, v1);
        CHECK_EQ(add.uses(), std::vector<Reg>{v0, v1});
        CHECK_EQ(add.defs(), std::vector<Reg>{v0});
        auto twice = Inst::imul(v0, v0);
        CHECK_EQ(twice.uses(), std::vector<Reg>{v0});
        CHECK_EQ(twice.defs(), std::vector<Reg>{v0});
    }

    SUBCASE("cmp only reads") {
        auto cmp = Inst::cmp(v0, v1);
        CHECK_EQ(cmp.uses(), std::vector<Reg>{v0, v1});
        CHECK(cmp.defs().empty());
        CHECK_FALSE(cmp.isTerminator());
    }

    SUBCASE("ret reads each value once") {
        auto ret = Inst::ret({v1, v0, v1});
        CHECK_EQ(ret.uses(), std::vector<Reg>{v1, v0});
        CHECK(ret.defs().empty());
        CHECK(ret.isReturn());
        CHECK(ret.isTerminator());
        CHECK_FALSE(ret.isBranch());
        CHECK(ret.branchTargets().empty());
    }
}

TEST_CASE("x64 Inst branches") {
    auto jmp = Inst::jmp(Block(3));
    CHECK(jmp.isBranch());
    CHECK(jmp.isTerminator());
    CHECK_EQ(jmp.branchTargets(), std::vector<Block>{Block(3)});
    CHECK(jmp.uses().empty());
    CHECK(jmp.defs().empty());

    auto jcc = Inst::jcc(kLess, Block(1), Block(2));
    CHECK(jcc.isBranch());
    CHECK_FALSE(jcc.isReturn());
    CHECK_EQ(jcc.branchTargets(), std::vector<Block>{Block(1), Block(2)});
}

TEST_CASE("x64 Inst replace") {
    auto v0 = Reg::virt(RegClass::integer(8), 0);
    auto v1 = Reg::virt(RegClass::integer(8), 1);
    auto rax = gpr(kRAX);

    auto add = Inst::add(v0, v0).replace(v0, rax);
    CHECK_EQ(add.dst, rax);
    CHECK_EQ(add.src, rax);

    auto mov = Inst::movRR(v1, v0).replace(v0, rax);
    CHECK_EQ(mov.dst, v1);
    CHECK_EQ(mov.src, rax);

    auto ret = Inst::ret({v0, v1}).replace(v1, rax);
    CHECK_EQ(ret.values, std::vector<Reg>{v0, rax});

    // The original is left untouched.
    auto original = Inst::sub(v0, v1);
    auto replaced = original.replace(v0, rax);
    CHECK_EQ(original.dst, v0);
    CHECK_EQ(replaced.dst, rax);
}

TEST_CASE("x64 Inst toString") {
    auto v0 = Reg::virt(RegClass::integer(8), 0);
    auto v1 = Reg::virt(RegClass::integer(4), 1);
    CHECK_EQ(Inst::movRR(v0, gpr(kRDI)).toString(), "mov v0, rdi");
    CHECK_EQ(Inst::movRI(gpr(kRAX, 4), -7).toString(), "mov eax, -7");
    CHECK_EQ(Inst::add(v0, v0).toString(), "add v0, v0");
    CHECK_EQ(Inst::sub(gpr(kR9), v0).toString(), "sub r9, v0");
    CHECK_EQ(Inst::imul(v1, Reg::spill(RegClass::integer(4), 2)).toString(), "imul v1, s2");
    CHECK_EQ(Inst::cmp(v0, gpr(kRCX)).toString(), "cmp v0, rcx");
    CHECK_EQ(Inst::jmp(Block(2)).toString(), "jmp block2");
    CHECK_EQ(Inst::jcc(kNotEqual, Block(1), Block(3)).toString(), "jne block1, block3");
    CHECK_EQ(Inst::jcc(kGreaterEqual, Block(0), Block(4)).toString(), "jge block0, block4");
    CHECK_EQ(Inst::ret().toString(), "ret");
    CHECK_EQ(Inst::ret({gpr(kRAX), xmm(1)}).toString(), "ret rax, xmm1");
    CHECK_EQ(regName<Inst>(Reg()), "<invalid>");
}

} // namespace x64
} // namespace tir
