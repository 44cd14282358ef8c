// Test runner for iptrack_tests. Library logging is silenced so doctest output stays readable;
// pass --log to see it.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cstring>

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    bool verbose = false;
    for (int i = 1; i < argc; ++i)
        if (std::strcmp(argv[i], "--log") == 0) verbose = true;
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::off);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
