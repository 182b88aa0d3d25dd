#ifndef SRC_TIR_X64_INST_HPP_
#define SRC_TIR_X64_INST_HPP_

#include "tir/Block.hpp"
#include "tir/Register.hpp"
#include "tir/x64/Registers.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tir {
namespace x64 {

enum Opcode {
    kMovRR,
    kMovRI,
    kAdd,
    kSub,
    kImul,
    kCmp,
    kJmp,
    kJcc,
    kRet
};

enum Condition {
    kEqual,
    kNotEqual,
    kLess,
    kLessEqual,
    kGreater,
    kGreaterEqual
};

// One x86-64 instruction, as a closed tagged union over Opcode. Arithmetic follows the two-address form, so |dst| is
// read as well as written. Jcc names both of its successors explicitly instead of falling through. Flags are not
// modeled as registers.
struct Inst {
    Inst() = delete;
    ~Inst() = default;

    static Inst movRR(Reg dst, Reg src);
    static Inst movRI(Reg dst, int64_t immediate);
    static Inst add(Reg dst, Reg src);
    static Inst sub(Reg dst, Reg src);
    static Inst imul(Reg dst, Reg src);
    static Inst cmp(Reg lhs, Reg rhs);
    static Inst jmp(Block target);
    static Inst jcc(Condition condition, Block taken, Block notTaken);
    static Inst ret(std::vector<Reg> values = {});

    // Instruction capability contract.
    std::vector<Reg> uses() const;
    std::vector<Reg> defs() const;
    std::vector<Block> branchTargets() const;
    bool isBranch() const { return opcode == kJmp || opcode == kJcc; }
    bool isReturn() const { return opcode == kRet; }
    bool isTerminator() const { return isBranch() || isReturn(); }
    Inst replace(Reg old, Reg replacement) const;
    std::string toString() const;

    static uint32_t physicalRegisterCount() { return kNumberOfRegisters; }
    static std::string physicalRegisterName(Reg reg) { return registerName(reg); }
    static Reg physicalRegister(uint32_t id) { return x64::physicalRegister(id); }
    // The stack and frame pointers are never allocated.
    static bool isReservedRegister(uint32_t id) { return id == kRSP || id == kRBP; }

    Opcode opcode;
    Reg dst;
    Reg src;
    int64_t immediate;
    Condition condition;
    Block target;
    Block notTaken;
    std::vector<Reg> values;

private:
    explicit Inst(Opcode op): opcode(op), immediate(0), condition(kEqual) {}
};

} // namespace x64
} // namespace tir

#endif // SRC_TIR_X64_INST_HPP_
