#include "tir/x64/Inst.hpp"

#include "tir/Inst.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cassert>

namespace {

const char* conditionSuffix(tir::x64::Condition condition) {
    switch (condition) {
    case tir::x64::kEqual:
        return "e";
    case tir::x64::kNotEqual:
        return "ne";
    case tir::x64::kLess:
        return "l";
    case tir::x64::kLessEqual:
        return "le";
    case tir::x64::kGreater:
        return "g";
    case tir::x64::kGreaterEqual:
        return "ge";
    }
    return "?";
}

} // namespace

namespace tir {
namespace x64 {

// static
Inst Inst::movRR(Reg dst, Reg src) {
    Inst inst(kMovRR);
    inst.dst = dst;
    inst.src = src;
    return inst;
}

// static
Inst Inst::movRI(Reg dst, int64_t immediate) {
    Inst inst(kMovRI);
    inst.dst = dst;
    inst.immediate = immediate;
    return inst;
}

// static
Inst Inst::add(Reg dst, Reg src) {
    Inst inst(kAdd);
    inst.dst = dst;
    inst.src = src;
    return inst;
}

// static
Inst Inst::sub(Reg dst, Reg src) {
    Inst inst(kSub);
    inst.dst = dst;
    inst.src = src;
    return inst;
}

// static
Inst Inst::imul(Reg dst, Reg src) {
    Inst inst(kImul);
    inst.dst = dst;
    inst.src = src;
    return inst;
}

// static
Inst Inst::cmp(Reg lhs, Reg rhs) {
    Inst inst(kCmp);
    inst.dst = lhs;
    inst.src = rhs;
    return inst;
}

// static
Inst Inst::jmp(Block target) {
    Inst inst(kJmp);
    inst.target = target;
    return inst;
}

// static
Inst Inst::jcc(Condition condition, Block taken, Block notTaken) {
    Inst inst(kJcc);
    inst.condition = condition;
    inst.target = taken;
    inst.notTaken = notTaken;
    return inst;
}

// static
Inst Inst::ret(std::vector<Reg> values) {
    Inst inst(kRet);
    inst.values = std::move(values);
    return inst;
}

std::vector<Reg> Inst::uses() const {
    switch (opcode) {
    case kMovRR:
        return {src};

    case kAdd:
    case kSub:
    case kImul:
    case kCmp:
        if (dst == src) {
            return {dst};
        }
        return {dst, src};

    case kRet: {
        std::vector<Reg> operands;
        for (auto value : values) {
            if (std::find(operands.begin(), operands.end(), value) == operands.end()) {
                operands.emplace_back(value);
            }
        }
        return operands;
    }

    case kMovRI:
    case kJmp:
    case kJcc:
        return {};
    }

    assert(false);
    return {};
}

std::vector<Reg> Inst::defs() const {
    switch (opcode) {
    case kMovRR:
    case kMovRI:
    case kAdd:
    case kSub:
    case kImul:
        return {dst};

    case kCmp:
    case kJmp:
    case kJcc:
    case kRet:
        return {};
    }

    assert(false);
    return {};
}

std::vector<Block> Inst::branchTargets() const {
    switch (opcode) {
    case kJmp:
        return {target};
    case kJcc:
        return {target, notTaken};
    default:
        return {};
    }
}

Inst Inst::replace(Reg old, Reg replacement) const {
    Inst inst = *this;
    if (inst.dst == old) { inst.dst = replacement; }
    if (inst.src == old) { inst.src = replacement; }
    for (auto& value : inst.values) {
        if (value == old) { value = replacement; }
    }
    return inst;
}

std::string Inst::toString() const {
    switch (opcode) {
    case kMovRR:
        return fmt::format("mov {}, {}", regName<Inst>(dst), regName<Inst>(src));
    case kMovRI:
        return fmt::format("mov {}, {}", regName<Inst>(dst), immediate);
    case kAdd:
        return fmt::format("add {}, {}", regName<Inst>(dst), regName<Inst>(src));
    case kSub:
        return fmt::format("sub {}, {}", regName<Inst>(dst), regName<Inst>(src));
    case kImul:
        return fmt::format("imul {}, {}", regName<Inst>(dst), regName<Inst>(src));
    case kCmp:
        return fmt::format("cmp {}, {}", regName<Inst>(dst), regName<Inst>(src));
    case kJmp:
        return fmt::format("jmp block{}", target.index());
    case kJcc:
        return fmt::format("j{} block{}, block{}", conditionSuffix(condition), target.index(), notTaken.index());
    case kRet: {
        std::string text = "ret";
        for (size_t i = 0; i < values.size(); ++i) {
            text += fmt::format("{}{}", i ? ", " : " ", regName<Inst>(values[i]));
        }
        return text;
    }
    }
    return "<bad opcode>";
}

} // namespace x64
} // namespace tir
