#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "logger/Logger.hpp"

int main(int argc, char **argv) {
    // Driver code logs on every job; keep test output readable
    Logger::setConsoleEnabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
