#include "tir/x64/Registers.hpp"

#include "fmt/format.h"

#include <array>
#include <cassert>

namespace {

const std::array<const char*, 8> kLegacyNames64 = {"rax", "rcx", "rdx", "rbx", "rsp", "rbp", "rsi", "rdi"};
const std::array<const char*, 8> kLegacyNames32 = {"eax", "ecx", "edx", "ebx", "esp", "ebp", "esi", "edi"};
const std::array<const char*, 8> kLegacyNames16 = {"ax", "cx", "dx", "bx", "sp", "bp", "si", "di"};
const std::array<const char*, 8> kLegacyNames8 = {"al", "cl", "dl", "bl", "spl", "bpl", "sil", "dil"};

} // namespace

namespace tir {
namespace x64 {

Reg physicalRegister(uint32_t id) {
    assert(id < kNumberOfRegisters);
    if (isGeneralRegister(id)) {
        return gpr(id);
    }
    return Reg::physical(RegClass::vector(16), id);
}

std::string registerName(Reg reg) {
    assert(reg.isPhysical());
    auto id = reg.id();
    if (id >= kNumberOfRegisters) {
        return fmt::format("<bad physical register {}>", id);
    }
    if (!isGeneralRegister(id)) {
        return fmt::format("xmm{}", id - kXMM0);
    }

    auto width = reg.regClass().width;
    if (id < 8) {
        switch (width) {
        case 1:
            return kLegacyNames8[id];
        case 2:
            return kLegacyNames16[id];
        case 4:
            return kLegacyNames32[id];
        default:
            return kLegacyNames64[id];
        }
    }

    switch (width) {
    case 1:
        return fmt::format("r{}b", id);
    case 2:
        return fmt::format("r{}w", id);
    case 4:
        return fmt::format("r{}d", id);
    default:
        return fmt::format("r{}", id);
    }
}

} // namespace x64
} // namespace tir
