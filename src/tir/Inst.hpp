#ifndef SRC_TIR_INST_HPP_
#define SRC_TIR_INST_HPP_

#include "tir/Block.hpp"
#include "tir/Register.hpp"

#include "fmt/format.h"

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tir {

// The capability contract every target instruction type must satisfy. The IR, its analyses and the register
// allocator are templates over the instruction type and only ever talk to it through these members:
//
//   std::vector<Reg> uses() const            registers read, in a stable order
//   std::vector<Reg> defs() const            registers written
//   std::vector<Block> branchTargets() const successor blocks if this is a branch, empty otherwise
//   bool isBranch() const
//   bool isReturn() const
//   bool isTerminator() const                 normally isBranch() || isReturn()
//   I replace(Reg old, Reg replacement) const copy with every occurrence of |old| in uses and defs substituted
//   std::string toString() const
//   static uint32_t physicalRegisterCount()
//   static std::string physicalRegisterName(Reg reg)
//   static Reg physicalRegister(uint32_t id)  the full-width physical register with that id
//   static bool isReservedRegister(uint32_t id) true for registers the allocator must never hand out
//
// InstTraits<I>::check() fails compilation with a readable message if I falls short.
template <typename I> struct InstTraits {
    static constexpr bool check() {
        static_assert(std::is_copy_constructible<I>::value, "instructions must be copyable values");
        static_assert(std::is_same<decltype(std::declval<const I&>().uses()), std::vector<Reg>>::value,
                      "I::uses() must return std::vector<Reg>");
        static_assert(std::is_same<decltype(std::declval<const I&>().defs()), std::vector<Reg>>::value,
                      "I::defs() must return std::vector<Reg>");
        static_assert(std::is_same<decltype(std::declval<const I&>().branchTargets()), std::vector<Block>>::value,
                      "I::branchTargets() must return std::vector<Block>");
        static_assert(std::is_same<decltype(std::declval<const I&>().isBranch()), bool>::value,
                      "I::isBranch() must return bool");
        static_assert(std::is_same<decltype(std::declval<const I&>().isReturn()), bool>::value,
                      "I::isReturn() must return bool");
        static_assert(std::is_same<decltype(std::declval<const I&>().isTerminator()), bool>::value,
                      "I::isTerminator() must return bool");
        static_assert(std::is_same<decltype(std::declval<const I&>().replace(Reg(), Reg())), I>::value,
                      "I::replace(Reg, Reg) must return a new I");
        static_assert(std::is_same<decltype(std::declval<const I&>().toString()), std::string>::value,
                      "I::toString() must return std::string");
        static_assert(std::is_same<decltype(I::physicalRegisterCount()), uint32_t>::value,
                      "I::physicalRegisterCount() must be a static returning uint32_t");
        static_assert(std::is_same<decltype(I::physicalRegisterName(Reg())), std::string>::value,
                      "I::physicalRegisterName(Reg) must be a static returning std::string");
        static_assert(std::is_same<decltype(I::physicalRegister(uint32_t(0))), Reg>::value,
                      "I::physicalRegister(uint32_t) must be a static returning Reg");
        static_assert(std::is_same<decltype(I::isReservedRegister(uint32_t(0))), bool>::value,
                      "I::isReservedRegister(uint32_t) must be a static returning bool");
        return true;
    }
};

// Printable name of any register, deferring to the target for physical registers.
template <typename I> std::string regName(Reg reg) {
    if (!reg.isValid()) {
        return "<invalid>";
    }
    switch (reg.type()) {
    case Reg::kVirtual:
        return fmt::format("v{}", reg.id());
    case Reg::kSpill:
        return fmt::format("s{}", reg.id());
    case Reg::kPhysical:
        return I::physicalRegisterName(reg);
    }
    return "<invalid>";
}

} // namespace tir

#endif // SRC_TIR_INST_HPP_
