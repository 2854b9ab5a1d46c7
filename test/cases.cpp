// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#undef  NDEBUG
#include "compiler.hpp"     // IWYU pragma: keep
#include "cases.hpp"

#include <string>
#include <vector>
#include <cstdlib>

#ifndef TEST_DATA
#define TEST_DATA "."   // NOLINT
#endif

namespace {
unsigned notices = 0;
unsigned warnings = 0;

void count(const std::string& msg, const char *type) {
    if(std::string(type) == "notice")
        ++notices;
    if(std::string(type) == "warn")
        ++warnings;
}
} // end namespace

auto main([[maybe_unused]] int argc, [[maybe_unused]] char **argv) -> int {
    try {
        system_logger logger;
        logger.set(0, count);

        assert(run_triplets("-1, 0, 1, 2, -1, -4") == "[[-1, -1, 2], [-1, 0, 1]]");
        assert(run_triplets("") == "[]");
        assert(run_triplets("0,0,0") == "[[0, 0, 0]]");

        assert(run_trim("1,2,3,4,5", 2, logger) == "1 -> 2 -> 3 -> 5 -> nil");
        assert(run_trim("1,2,3,4,5", 5, logger) == "2 -> 3 -> 4 -> 5 -> nil");
        assert(notices == 0);
        assert(run_trim("1,2,3", 4, logger) == "1 -> 2 -> 3 -> nil");
        assert(run_trim("", 1, logger) == "nil");
        assert(notices == 2);

        assert(run_palindrome("racecar") == "true");
        assert(run_palindrome("abab") == "false");
        assert(run_palindrome("") == "true");

        const keyfile::keys trim = {{"list", "1 2 3"}, {"n", "1"}};
        assert(run_case("trim.x", trim, logger) == "1 -> 2 -> nil");

        bool thrown = false;
        try {
            run_case("sorting.x", trim, logger);
        }
        catch(const std::invalid_argument& e) {
            thrown = true;
        }
        assert(thrown);

        auto demos = demo_cases();
        assert(demos.size() == 13);
        assert(run_cases(demos, logger) == 13);
        assert(warnings == 0);

        keyfile cases;
        assert(!::chdir(TEST_DATA));
        assert(cases.load(std::string("test.conf")));
        cases.load("trim.broken", {{"list", "1,2"}, {"n", "two"}});
        cases.load("unknown.kind", {{"x", "1"}});
        assert(run_cases(cases, logger) == 4);
        assert(warnings == 2);
        assert(run_case("palindrome.spaced", cases["palindrome.spaced"], logger) == "true");
        assert(run_case("trim.head", cases["trim.head"], logger) == "2 -> 3 -> 4 -> 5 -> nil");

        assert(joined({"trim", "2", "1", "2", "3"}, 2) == "1,2,3");
        assert(joined({"-1", "0,1"}) == "-1,0,1");
        assert(joined({"triplets"}, 1).empty());

        assert(run_command({"triplets", "-1", "0", "1", "2", "-1", "-4"}, logger) == "[[-1, -1, 2], [-1, 0, 1]]");
        assert(run_command({"triplets", "-1,0,1"}, logger) == "[[-1, 0, 1]]");
        assert(run_command({"trim", "2", "1", "2", "3", "4", "5"}, logger) == "1 -> 2 -> 3 -> 5 -> nil");
        assert(run_command({"palindrome", "racecar"}, logger) == "true");

        unsigned usage = 0;
        const std::vector<std::vector<std::string>> misuse = {
            {}, {"sort", "1"}, {"trim"}, {"palindrome"}, {"palindrome", "a", "b"},
        };
        for(const auto& args : misuse) {
            try {
                run_command(args, logger);
            }
            catch(const usage_error& e) {
                ++usage;
            }
        }
        assert(usage == misuse.size());

        thrown = false;
        try {
            run_command({"trim", "two", "1"}, logger);
        }
        catch(const usage_error& e) {
            ::exit(-1);
        }
        catch(const std::invalid_argument& e) {
            thrown = true;
        }
        assert(thrown);

        auto loaded = load_cases("test.conf", true, logger);
        assert(loaded.exists("trim.head"));
        auto fallback = load_cases("missing.conf", false, logger);
        assert(fallback.size() == 13);
        assert(load_cases("", false, logger).size() == 13);

        thrown = false;
        try {
            load_cases("missing.conf", true, logger);
        }
        catch(const std::runtime_error& e) {
            thrown = true;
        }
        assert(thrown);

        auto idle = load_cases("idle.conf", true, logger);
        assert(run_cases(idle, logger) == 0);
    }
    catch(...) {
        ::exit(-1);
    }
}
