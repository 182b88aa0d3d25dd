#ifndef SRC_TIR_ERROR_REPORTER_HPP_
#define SRC_TIR_ERROR_REPORTER_HPP_

#include "tir/Block.hpp"

#include <string>
#include <vector>

namespace tir {

// Recoverable, data-dependent failures. Programmer errors are asserted instead and never reach the ErrorReporter.
enum ErrorCode {
    kEmptyFunctionBody,
    kBlockNotTerminated,
    kGeneric
};

struct Error {
    ErrorCode code;
    // The offending block, or Block::none() if the error is not about a specific block.
    Block block;
    std::string message;
};

class ErrorReporter {
public:
    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    explicit ErrorReporter(bool suppress = false);
    ~ErrorReporter() = default;

    void addError(const std::string& error);

    // Specific errors.

    // CFG construction was requested on a function with no blocks.
    void addEmptyFunctionBodyError(const std::string& functionName);
    // |block| does not end in a branch or return.
    void addBlockNotTerminatedError(const std::string& functionName, Block block);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }
    // Most recent error, the reporter must not be ok().
    const Error& lastError() const;
    void clear() { m_errors.clear(); }

private:
    void add(Error error);

    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace tir

#endif // SRC_TIR_ERROR_REPORTER_HPP_
