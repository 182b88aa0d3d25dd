#include "tir/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>

namespace tir {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

void ErrorReporter::addError(const std::string& error) { add(Error{kGeneric, Block::none(), error}); }

void ErrorReporter::addEmptyFunctionBodyError(const std::string& functionName) {
    add(Error{kEmptyFunctionBody, Block::none(), fmt::format("Function '{}' body is empty", functionName)});
}

void ErrorReporter::addBlockNotTerminatedError(const std::string& functionName, Block block) {
    add(Error{kBlockNotTerminated, block,
              fmt::format("Block {} of function '{}' does not end with a terminator", block.index(), functionName)});
}

const Error& ErrorReporter::lastError() const {
    assert(m_errors.size());
    return m_errors.back();
}

void ErrorReporter::add(Error error) {
    if (!m_suppress) {
        spdlog::error(error.message);
    }
    m_errors.emplace_back(std::move(error));
}

} // namespace tir
