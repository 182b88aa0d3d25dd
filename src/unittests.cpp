#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Validator and allocator diagnostics are logged at debug level, keep them visible when a test fails.
    spdlog::set_level(spdlog::level::debug);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
