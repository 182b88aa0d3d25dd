#ifndef SRC_TIR_REGISTER_HPP_
#define SRC_TIR_REGISTER_HPP_

#include <cassert>
#include <cstdint>
#include <string>

namespace tir {

// Register class: what kind of data a register holds and how wide it is, in bytes. Widths must be powers of two.
struct RegClass {
    enum Kind : uint8_t { kInt = 0, kFloat = 1, kVec = 2 };

    RegClass(): kind(kInt), width(8) {}
    RegClass(Kind k, uint32_t w): kind(k), width(w) { assert(isValidWidth(w)); }
    ~RegClass() = default;

    static RegClass integer(uint32_t w) { return RegClass(kInt, w); }
    static RegClass floating(uint32_t w) { return RegClass(kFloat, w); }
    static RegClass vector(uint32_t w) { return RegClass(kVec, w); }

    static constexpr bool isValidWidth(uint32_t w) { return w != 0 && (w & (w - 1)) == 0 && w <= (1u << 15); }

    bool operator==(const RegClass& c) const { return kind == c.kind && width == c.width; }
    bool operator!=(const RegClass& c) const { return !(*this == c); }

    std::string toString() const;

    Kind kind;
    uint32_t width;
};

// A register packed into 32 bits. From least to most significant bit:
//   [0, 2)  storage type, one of Type
//   [2, 4)  RegClass::Kind
//   [4, 8)  log2 of the width in bytes
//   [8, 32) id, dense within its storage type
// The all-ones value is reserved as the invalid register, which is what a default-constructed Reg holds.
class Reg {
public:
    enum Type : uint8_t { kVirtual = 0, kPhysical = 1, kSpill = 2 };

    static constexpr uint32_t kTypeShift = 0;
    static constexpr uint32_t kTypeBits = 2;
    static constexpr uint32_t kKindShift = kTypeShift + kTypeBits;
    static constexpr uint32_t kKindBits = 2;
    static constexpr uint32_t kWidthShift = kKindShift + kKindBits;
    static constexpr uint32_t kWidthBits = 4;
    static constexpr uint32_t kIdShift = kWidthShift + kWidthBits;
    static constexpr uint32_t kIdBits = 32 - kIdShift;
    static constexpr uint32_t kMaxId = (1u << kIdBits) - 1;
    static constexpr uint32_t kInvalid = 0xffffffff;

    Reg(): m_bits(kInvalid) {}
    Reg(Type type, RegClass regClass, uint32_t id);
    ~Reg() = default;

    static Reg virt(RegClass regClass, uint32_t id) { return Reg(kVirtual, regClass, id); }
    static Reg physical(RegClass regClass, uint32_t id) { return Reg(kPhysical, regClass, id); }
    static Reg spill(RegClass regClass, uint32_t slot) { return Reg(kSpill, regClass, slot); }

    inline bool isValid() const { return m_bits != kInvalid; }
    inline Type type() const { return static_cast<Type>(field(kTypeShift, kTypeBits)); }
    inline bool isVirtual() const { return isValid() && type() == kVirtual; }
    inline bool isPhysical() const { return isValid() && type() == kPhysical; }
    inline bool isSpill() const { return isValid() && type() == kSpill; }
    inline uint32_t id() const { assert(isValid()); return field(kIdShift, kIdBits); }
    RegClass regClass() const;
    inline uint32_t bits() const { return m_bits; }

    bool operator==(const Reg& r) const { return m_bits == r.m_bits; }
    bool operator!=(const Reg& r) const { return m_bits != r.m_bits; }
    bool operator<(const Reg& r) const { return m_bits < r.m_bits; }

private:
    inline uint32_t field(uint32_t shift, uint32_t bits) const { return (m_bits >> shift) & ((1u << bits) - 1); }

    uint32_t m_bits;
};

static_assert(Reg::kIdShift + Reg::kIdBits == 32, "Reg fields must fill 32 bits");
static_assert((1u << Reg::kWidthBits) > 15, "Reg width field must hold log2 of the largest width");

} // namespace tir

#endif // SRC_TIR_REGISTER_HPP_
