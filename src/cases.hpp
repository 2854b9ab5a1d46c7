// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_CASES_HPP_
#define TANDEM_CASES_HPP_

#include "triplets.hpp"
#include "list.hpp"
#include "strings.hpp"
#include "scan.hpp"
#include "keyfile.hpp"
#include "print.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>

namespace tandem {
class usage_error final : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

inline auto joined(const std::vector<std::string>& args, std::size_t first = 0) {
    std::string result;
    for(auto pos = first; pos < args.size(); ++pos) {
        if(!result.empty())
            result += ',';
        result += args[pos];
    }
    return result;
}

inline auto run_triplets(std::string_view values) {
    return format("{}", find_zero_sum_triplets(get_integers(values)));
}

inline auto run_trim(std::string_view values, int n, system_logger& logger) {
    auto head = make_chain<int>(get_integers(values));
    auto size = chain_size(head);
    if(n <= 0 || std::size_t(n) > size)
        logger.notice("n={} outside list of {}, list unchanged", n, size);
    return to_string(remove_nth_from_end(std::move(head), n));
}

inline auto run_palindrome(std::string_view text) -> std::string {
    return is_palindrome(text) ? "true" : "false";
}

// A case is a keyfile group named "<kind>.<label>"; the kind picks the
// operation and the group keys supply its literal inputs.
inline auto run_case(const std::string& name, const keyfile::keys& keys, system_logger& logger) -> std::string {
    auto kind = std::string_view(name).substr(0, name.find('.'));
    logger.debug(1, "case {}: {}", name, kind);
    if(kind == "triplets")
        return run_triplets(key_or(keys, "values"));
    if(kind == "trim")
        return run_trim(key_or(keys, "list"), get_integer(key_or(keys, "n")), logger);
    if(kind == "palindrome")
        return run_palindrome(key_or(keys, "text"));
    throw std::invalid_argument(format("{}: unknown case kind", name));
}

// Runs every case group in name order and returns how many succeeded. The
// unnamed "_" group is skipped; a failing case is logged as a warning.
inline auto run_cases(const keyfile& cases, system_logger& logger) {
    unsigned count = 0;
    for(const auto& [name, keys] : cases) {
        if(name == "_")
            continue;
        try {
            println("{}: {}", name, run_case(name, keys, logger));
            ++count;
        }
        catch(const std::exception& e) {
            logger.warn("{}: {}", name, e.what());
        }
    }
    return count;
}

inline auto demo_cases() {
    keyfile cases;
    cases.load("triplets.1", {{"values", "-1, 0, 1, 2, -1, -4"}});
    cases.load("triplets.2", {{"values", "0, 0, 0"}});
    cases.load("triplets.3", {{"values", ""}});
    cases.load("triplets.4", {{"values", "1, 2, -2, -1"}});
    cases.load("triplets.5", {{"values", "-2, 0, 1, 1, 2"}});
    cases.load("triplets.6", {{"values", "-4, -2, -2, -2, 0, 1, 2, 2, 2, 3, 3, 4, 4, 6, 6"}});
    cases.load("triplets.7", {{"values", "-5, 1, 10, -1, -2, 3, 4, -3, 0"}});
    cases.load("triplets.8", {{"values", "-10, 5, 2, 4, -4, -5, 0, 0"}});
    cases.load("trim.1", {{"list", "1, 2, 3, 4, 5"}, {"n", "2"}});
    cases.load("trim.2", {{"list", "1, 2, 3, 4, 5"}, {"n", "5"}});
    cases.load("palindrome.1", {{"text", "racecar"}});
    cases.load("palindrome.2", {{"text", "abab"}});
    cases.load("palindrome.3", {{"text", "madam"}});
    return cases;
}

// An explicitly named config must load. Otherwise a missing or unreadable
// file falls back to the built-in demo cases.
inline auto load_cases(const std::string& path, bool required, system_logger& logger) -> keyfile {
    keyfile cases;
    if(!path.empty() && cases.load(path)) {
        logger.info("{}: loaded {} groups", path, cases.size());
        return cases;
    }
    if(required)
        throw std::runtime_error(format("{}: cannot read config", path));
    logger.info("using built-in cases");
    return demo_cases();
}

// Runs one command line request, args[0] being the command name.
inline auto run_command(const std::vector<std::string>& args, system_logger& logger) -> std::string {
    if(args.empty())
        throw usage_error("missing command");

    const auto& command = args[0];
    if(command == "triplets")
        return run_triplets(joined(args, 1));
    if(command == "trim") {
        if(args.size() < 2)
            throw usage_error("trim needs n");
        return run_trim(joined(args, 2), get_integer(args[1]), logger);
    }
    if(command == "palindrome") {
        if(args.size() != 2)
            throw usage_error("palindrome needs one text argument");
        return run_palindrome(args[1]);
    }
    throw usage_error(format("{}: unknown command", command));
}
} // end namespace
#endif
