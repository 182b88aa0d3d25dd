#include "tir/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace tir {

TEST_CASE("ErrorReporter") {
    SUBCASE("starts ok") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK_EQ(er.errorCount(), 0);
    }
    SUBCASE("typed errors") {
        ErrorReporter er(true);
        er.addEmptyFunctionBodyError("foo");
        REQUIRE_EQ(er.errorCount(), 1);
        CHECK(!er.ok());
        CHECK_EQ(er.lastError().code, kEmptyFunctionBody);
        CHECK(er.lastError().block.isNone());
        CHECK_EQ(er.lastError().message, "Function 'foo' body is empty");

        er.addBlockNotTerminatedError("foo", Block(3));
        REQUIRE_EQ(er.errorCount(), 2);
        CHECK_EQ(er.lastError().code, kBlockNotTerminated);
        CHECK(er.lastError().block == Block(3));
        CHECK_EQ(er.lastError().message, "Block 3 of function 'foo' does not end with a terminator");
        CHECK_EQ(er.errors().front().code, kEmptyFunctionBody);
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addError("Something went wrong");
        CHECK_EQ(er.lastError().code, kGeneric);
        er.clear();
        CHECK(er.ok());
    }
}

} // namespace tir
