#include "tir/Register.hpp"

#include "fmt/format.h"

namespace tir {

std::string RegClass::toString() const {
    switch (kind) {
    case kInt:
        return fmt::format("i{}", width * 8);
    case kFloat:
        return fmt::format("f{}", width * 8);
    case kVec:
        return fmt::format("v{}x8", width);
    }
    return "?";
}

Reg::Reg(Type type, RegClass regClass, uint32_t id) {
    assert(type <= kSpill);
    assert(RegClass::isValidWidth(regClass.width));
    assert(id <= kMaxId);
    uint32_t log2Width = 0;
    while ((1u << log2Width) < regClass.width) {
        ++log2Width;
    }
    m_bits = (static_cast<uint32_t>(type) << kTypeShift) | (static_cast<uint32_t>(regClass.kind) << kKindShift) |
        (log2Width << kWidthShift) | (id << kIdShift);
}

RegClass Reg::regClass() const {
    assert(isValid());
    return RegClass(static_cast<RegClass::Kind>(field(kKindShift, kKindBits)), 1u << field(kWidthShift, kWidthBits));
}

} // namespace tir
