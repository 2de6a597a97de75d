#include <iostream>

#include "cli_args.hpp"
#include "logger.hpp"
#include "runner.hpp"

using namespace comment_remover;

// Main program entry point
int main(int argc, char* argv[]) {
    RemoverArgs args;
    switch (parse_remover_arguments(argc, argv, args, std::cout, std::cerr)) {
        case ParseResult::HelpShown: return kExitOk;
        case ParseResult::Error: return kExitFatal;
        case ParseResult::Ok: break;
    }

    Logger logger(std::cerr);
    if (args.quiet) logger.set_min_level(LogLevel::Warning);

    return run_remover(args, logger);
}
