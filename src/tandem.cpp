// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#include "cases.hpp"

#include <string>
#include <vector>
#include <cstdlib>
#include <unistd.h>

using namespace tandem;

namespace {
system_logger logger;

[[noreturn]] void usage(int code) {
    println(code ? std::cerr : std::cout,
        "usage: tandem [-v] [-c file] [command args...]\n"
        "  triplets <int> [<int>...]   unique zero-sum triplets\n"
        "  trim <n> [<int>...]         remove n-th node from the end\n"
        "  palindrome <text>           check front/back symmetry\n"
        "  (no command)                run config or built-in cases");
    ::exit(code);
}
} // end namespace

auto main(int argc, char **argv) -> int {
    std::string config;
    bool required = false;
    unsigned verbose = 1;

    if(auto env = ::getenv("TANDEM_CONFIG"); env != nullptr)
        config = env;

    int opt{};
    while((opt = ::getopt(argc, argv, "+c:vh")) != -1) {
        switch(opt) {
        case 'c':
            config = optarg;
            required = true;
            break;
        case 'v':
            ++verbose;
            break;
        case 'h':
            usage(0);
        default:
            usage(2);
        }
    }

    logger.set(verbose);
    logger.open("tandem");
    auto status = 0;
    try {
        if(optind >= argc) {
            auto count = run_cases(load_cases(config, required, logger), logger);
            logger.info("{} cases run", count);
            status = count ? 0 : 1;
        }
        else
            println("{}", run_command(std::vector<std::string>(argv + optind, argv + argc), logger));
    }
    catch(const usage_error& e) {
        logger.close();
        die(2, "tandem: {}", e.what());
    }
    catch(const std::exception& e) {
        logger.error("{}", e.what());
        status = 1;
    }
    logger.close();
    return status;
}
