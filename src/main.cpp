// Standard
#include <csignal>

// Internal
#include "Runner.hpp"
#include "Utility.hpp"

auto main(int argc, const char* const argv[]) -> int {
    signal(SIGSEGV, helper::crashHandler);

    Runner::runPipeline(argc, argv);
}
