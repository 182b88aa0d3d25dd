#ifndef SRC_TIR_X64_REGISTERS_HPP_
#define SRC_TIR_X64_REGISTERS_HPP_

#include "tir/Register.hpp"

#include <cstdint>
#include <string>

// Physical register file of x86-64. Ids 0 through 15 are the general purpose registers in encoding order, ids 16
// through 31 are XMM0 through XMM15.
namespace tir {
namespace x64 {

static constexpr uint32_t kRAX = 0;
static constexpr uint32_t kRCX = 1;
static constexpr uint32_t kRDX = 2;
static constexpr uint32_t kRBX = 3;
static constexpr uint32_t kRSP = 4;
static constexpr uint32_t kRBP = 5;
static constexpr uint32_t kRSI = 6;
static constexpr uint32_t kRDI = 7;
static constexpr uint32_t kR8 = 8;
static constexpr uint32_t kR9 = 9;
static constexpr uint32_t kR10 = 10;
static constexpr uint32_t kR11 = 11;
static constexpr uint32_t kR12 = 12;
static constexpr uint32_t kR13 = 13;
static constexpr uint32_t kR14 = 14;
static constexpr uint32_t kR15 = 15;

static constexpr uint32_t kXMM0 = 16;
static constexpr uint32_t kNumberOfGeneralRegisters = 16;
static constexpr uint32_t kNumberOfVectorRegisters = 16;
static constexpr uint32_t kNumberOfRegisters = kNumberOfGeneralRegisters + kNumberOfVectorRegisters;

inline bool isGeneralRegister(uint32_t id) { return id < kNumberOfGeneralRegisters; }

// Full-width register for |id|, 8 bytes for general purpose registers and 16 for XMM registers.
Reg physicalRegister(uint32_t id);

// Convenience constructors for general purpose registers at a given width.
inline Reg gpr(uint32_t id, uint32_t width = 8) { return Reg::physical(RegClass::integer(width), id); }
inline Reg xmm(uint32_t n) { return Reg::physical(RegClass::vector(16), kXMM0 + n); }

// Lowercase Intel names that follow the width of |reg|, for example rax, eax, ax and al.
std::string registerName(Reg reg);

} // namespace x64
} // namespace tir

#endif // SRC_TIR_X64_REGISTERS_HPP_
