// tests/test_main.cpp
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <Kiln/Utils/Logger.hpp>

int main(int argc, char** argv) {
    // Console logging only; tests create no log files.
    Kiln::Utils::Logger::GetCoreLogger();
    spdlog::set_level(spdlog::level::warn);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int result = context.run();
    Kiln::Utils::Logger::Shutdown();
    return result;
}
