// tirc runs the register allocation pipeline over one of the built-in sample functions and prints the result.
#include "tir/ErrorReporter.hpp"
#include "tir/Function.hpp"
#include "tir/LivenessAnalysis.hpp"
#include "tir/Pipeline.hpp"
#include "tir/RegisterAllocator.hpp"
#include "tir/x64/Inst.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

DEFINE_string(example, "loop", "Sample function to allocate, one of: straight, loop, diamond, pressure.");
DEFINE_int32(numberOfRegisters, -1,
             "Number of allocatable registers per class, or -1 for every unreserved register.");
DEFINE_bool(printCFG, false, "Print the function with predecessor and successor annotations before allocation.");
DEFINE_bool(printLiveness, false, "Print live sets and live ranges before allocation.");
DEFINE_bool(validate, true, "Validate the products of each pipeline step.");
DEFINE_string(logLevel, "warn", "Log level: trace, debug, info, warn, err, critical or off.");

namespace {

using tir::x64::Inst;

// Value copied through a chain of blocks.
void buildStraight(tir::Function<Inst>& function) {
    auto v0 = function.newVReg(tir::RegClass::integer(8));
    auto b0 = function.addEmptyBlock();
    auto b1 = function.addEmptyBlock();
    auto b2 = function.addEmptyBlock();
    function.mutableBlockData(b0).push(Inst::movRR(v0, tir::x64::gpr(tir::x64::kRDI)));
    function.mutableBlockData(b0).push(Inst::jmp(b1));
    function.mutableBlockData(b1).push(Inst::add(v0, v0));
    function.mutableBlockData(b1).push(Inst::jmp(b2));
    function.mutableBlockData(b2).push(Inst::movRR(tir::x64::gpr(tir::x64::kRAX), v0));
    function.mutableBlockData(b2).push(Inst::ret({tir::x64::gpr(tir::x64::kRAX)}));
}

// Counts down from the argument, summing as it goes.
void buildLoop(tir::Function<Inst>& function) {
    auto count = function.argument(0);
    auto sum = function.newVReg(tir::RegClass::integer(8));
    auto one = function.newVReg(tir::RegClass::integer(8));
    auto zero = function.newVReg(tir::RegClass::integer(8));
    auto entry = function.addEmptyBlock();
    auto header = function.addEmptyBlock();
    auto body = function.addEmptyBlock();
    auto exit = function.addEmptyBlock();
    function.mutableBlockData(entry).push(Inst::movRI(sum, 0));
    function.mutableBlockData(entry).push(Inst::movRI(one, 1));
    function.mutableBlockData(entry).push(Inst::movRI(zero, 0));
    function.mutableBlockData(entry).push(Inst::jmp(header));
    function.mutableBlockData(header).push(Inst::cmp(count, zero));
    function.mutableBlockData(header).push(Inst::jcc(tir::x64::kEqual, exit, body));
    function.mutableBlockData(body).push(Inst::add(sum, count));
    function.mutableBlockData(body).push(Inst::sub(count, one));
    function.mutableBlockData(body).push(Inst::jmp(header));
    function.mutableBlockData(exit).push(Inst::ret({sum}));
}

// Picks the larger of the two arguments.
void buildDiamond(tir::Function<Inst>& function) {
    auto a = function.argument(0);
    auto b = function.argument(1);
    auto result = function.newVReg(tir::RegClass::integer(8));
    auto entry = function.addEmptyBlock();
    auto left = function.addEmptyBlock();
    auto right = function.addEmptyBlock();
    auto join = function.addEmptyBlock();
    function.mutableBlockData(entry).push(Inst::cmp(a, b));
    function.mutableBlockData(entry).push(Inst::jcc(tir::x64::kGreaterEqual, left, right));
    function.mutableBlockData(left).push(Inst::movRR(result, a));
    function.mutableBlockData(left).push(Inst::jmp(join));
    function.mutableBlockData(right).push(Inst::movRR(result, b));
    function.mutableBlockData(right).push(Inst::jmp(join));
    function.mutableBlockData(join).push(Inst::ret({result}));
}

// Keeps eight values live at once.
void buildPressure(tir::Function<Inst>& function) {
    static constexpr int kNumberOfValues = 8;
    std::vector<tir::Reg> values;
    auto b0 = function.addEmptyBlock();
    auto& blockData = function.mutableBlockData(b0);
    for (int i = 0; i < kNumberOfValues; ++i) {
        values.emplace_back(function.newVReg(tir::RegClass::integer(8)));
        blockData.push(Inst::movRI(values.back(), i));
    }
    for (int i = 1; i < kNumberOfValues; ++i) {
        blockData.push(Inst::add(values[0], values[i]));
    }
    blockData.push(Inst::ret({values[0]}));
}

// Prints the intermediate products as the pipeline reaches them.
class PrintingPipeline : public tir::Pipeline<Inst> {
public:
    explicit PrintingPipeline(std::shared_ptr<tir::ErrorReporter> errorReporter):
        tir::Pipeline<Inst>(errorReporter) {}
    virtual ~PrintingPipeline() = default;

protected:
    bool afterCFG(const tir::Function<Inst>& function) override {
        if (FLAGS_printCFG) {
            std::cout << function.toString(true) << std::endl;
        }
        return true;
    }
    bool afterLiveness(const tir::Function<Inst>& /* function */, const tir::LivenessAnalysis& liveness) override {
        if (FLAGS_printLiveness) {
            std::cout << liveness.toString<Inst>() << std::endl;
        }
        return true;
    }
    bool afterAllocation(const tir::Function<Inst>& /* function */, const tir::LivenessAnalysis& /* liveness */,
                         const tir::RegAllocResult& result) override {
        for (const auto& allocation : result.allocations) {
            std::cout << allocation.range.toString() << " -> " << allocation.slot.toString() << std::endl;
        }
        std::cout << "spill slots: " << result.numberOfSpillSlots << std::endl << std::endl;
        return true;
    }
};

} // namespace

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, false);
    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    std::unique_ptr<tir::Function<Inst>> function;
    if (FLAGS_example == "straight") {
        function = std::make_unique<tir::Function<Inst>>("straight", std::vector<tir::RegClass>{},
                                                         std::vector<tir::RegClass>{});
        buildStraight(*function);
    } else if (FLAGS_example == "loop") {
        function = std::make_unique<tir::Function<Inst>>(
            "loop", std::vector<tir::RegClass>{tir::RegClass::integer(8)}, std::vector<tir::RegClass>{});
        buildLoop(*function);
    } else if (FLAGS_example == "diamond") {
        function = std::make_unique<tir::Function<Inst>>(
            "diamond", std::vector<tir::RegClass>{tir::RegClass::integer(8), tir::RegClass::integer(8)},
            std::vector<tir::RegClass>{});
        buildDiamond(*function);
    } else if (FLAGS_example == "pressure") {
        function = std::make_unique<tir::Function<Inst>>("pressure", std::vector<tir::RegClass>{},
                                                         std::vector<tir::RegClass>{});
        buildPressure(*function);
    } else {
        SPDLOG_ERROR("Unknown example '{}', expected one of straight, loop, diamond, pressure.", FLAGS_example);
        return -1;
    }

    std::cout << function->toString() << std::endl;

    auto errorReporter = std::make_shared<tir::ErrorReporter>();
    PrintingPipeline pipeline(errorReporter);
    pipeline.setValidate(FLAGS_validate);
    if (FLAGS_numberOfRegisters >= 0) {
        pipeline.setNumberOfRegisters(static_cast<uint32_t>(FLAGS_numberOfRegisters));
    }
    if (!pipeline.run(*function)) {
        SPDLOG_ERROR("Register allocation failed for '{}' with {} errors.", function->name(),
                     errorReporter->errorCount());
        return -1;
    }

    std::cout << function->toString() << std::endl;
    return 0;
}
