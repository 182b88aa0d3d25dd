#ifndef SRC_TIR_PIPELINE_HPP_
#define SRC_TIR_PIPELINE_HPP_

// By default we turn off pipeline validation in Release builds. The macro feeds the inline Pipeline constructor, so
// every translation unit must see the same value. Override it for the whole build, or call setValidate() instead.
#ifndef TIR_PIPELINE_VALIDATE
#ifdef NDEBUG
#define TIR_PIPELINE_VALIDATE 0
#else
#define TIR_PIPELINE_VALIDATE 1
#endif // NDEBUG
#endif // TIR_PIPELINE_VALIDATE

#include "tir/DominatorTree.hpp"
#include "tir/ErrorReporter.hpp"
#include "tir/Function.hpp"
#include "tir/LivenessAnalysis.hpp"
#include "tir/RegisterAllocator.hpp"
#include "tir/Validator.hpp"

#include "spdlog/spdlog.h"

#include <cstdint>
#include <limits>
#include <memory>

namespace tir {

// Utility class to take a Function from virtual registers to allocated registers: CFG construction, dominator tree,
// liveness, register allocation and rewriting. Optionally validates the products of each step, and calls a virtual
// method after each one for additional inspection.
template <typename I> class Pipeline {
public:
    Pipeline(): Pipeline(std::make_shared<ErrorReporter>()) {}
    explicit Pipeline(std::shared_ptr<ErrorReporter> errorReporter):
        m_errorReporter(errorReporter),
        m_numberOfRegisters(std::numeric_limits<uint32_t>::max()),
        m_validate(TIR_PIPELINE_VALIDATE) {}
    virtual ~Pipeline() = default;

    // Parameters to override before run(), or leave at defaults.
    // Upper limit on allocatable registers of each class, for forcing spills. Defaults to every non-reserved register.
    uint32_t numberOfRegisters() const { return m_numberOfRegisters; }
    void setNumberOfRegisters(uint32_t n) { m_numberOfRegisters = n; }

    bool validate() const { return m_validate; }
    void setValidate(bool validate) { m_validate = validate; }

    // Allocates registers for |function| and rewrites it in place. Returns false if CFG construction reported an
    // error, a validation failed, or an after* method asked to stop. The function is only modified by the final step.
    bool run(Function<I>& function) {
        m_liveness.reset();
        m_allocation.reset();

        if (!function.constructCFG(m_errorReporter)) {
            return false;
        }
        if (m_validate && !Validator::validateCFG(function.cfg())) {
            return false;
        }
        if (!afterCFG(function)) {
            return false;
        }

        const auto& domTree = function.constructDominatorTree();
        if (m_validate && !Validator::validateDominatorTree(function.cfg(), domTree)) {
            return false;
        }
        if (!afterDominatorTree(function, domTree)) {
            return false;
        }

        m_liveness = std::make_unique<LivenessAnalysis>(function);
        if (m_validate && (!Validator::validateLiveness(*m_liveness) || !Validator::validateLiveRanges(*m_liveness))) {
            return false;
        }
        if (!afterLiveness(function, *m_liveness)) {
            return false;
        }

        auto allocator = RegisterAllocator::forTarget<I>(m_numberOfRegisters);
        m_allocation = std::make_unique<RegAllocResult>(allocator.allocateRegisters(function, *m_liveness));
        if (m_validate && !Validator::validateAllocation(*m_liveness, *m_allocation)) {
            return false;
        }
        if (!afterAllocation(function, *m_liveness, *m_allocation)) {
            return false;
        }

        if (!applyAllocation(function, *m_allocation)) {
            return false;
        }
        if (m_validate && !Validator::validateRewrite(function)) {
            return false;
        }
        if (!afterRewrite(function)) {
            return false;
        }

        SPDLOG_DEBUG("Pipeline finished function '{}' with {} spill slots", function.name(),
                     m_allocation->numberOfSpillSlots);
        return true;
    }

    // Products of the most recent run(), nullptr until the step has run.
    const LivenessAnalysis* liveness() const { return m_liveness.get(); }
    const RegAllocResult* allocation() const { return m_allocation.get(); }

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

    // Called after each step, after validation if that is on. Their default implementations do nothing. They are
    // intended primarily for use by the Pipeline unittests, allowing for additional testing work on each step as
    // needed. Any method that returns false will stop the pipeline from moving to the next step.
    virtual bool afterCFG(const Function<I>& /* function */) { return true; }
    virtual bool afterDominatorTree(const Function<I>& /* function */, const DominatorTree& /* domTree */) {
        return true;
    }
    virtual bool afterLiveness(const Function<I>& /* function */, const LivenessAnalysis& /* liveness */) {
        return true;
    }
    virtual bool afterAllocation(const Function<I>& /* function */, const LivenessAnalysis& /* liveness */,
                                 const RegAllocResult& /* result */) {
        return true;
    }
    virtual bool afterRewrite(const Function<I>& /* function */) { return true; }

protected:
    std::shared_ptr<ErrorReporter> m_errorReporter;
    uint32_t m_numberOfRegisters;
    bool m_validate;
    std::unique_ptr<LivenessAnalysis> m_liveness;
    std::unique_ptr<RegAllocResult> m_allocation;
};

} // namespace tir

#endif // SRC_TIR_PIPELINE_HPP_
