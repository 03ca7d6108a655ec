#include <catch2/catch_session.hpp>

#include "gt/core/Logger.hpp"

int main(int argc, char* argv[]) {
    // Rejection and fallback paths log warnings; only errors reach the test output.
    gt::core::Logger::SetMinimumLevel(gt::core::LogLevel::Error);

    Catch::Session session;
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
