// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#undef  NDEBUG
#include "compiler.hpp"     // IWYU pragma: keep
#include "scan.hpp"

#include <vector>
#include <cstdio>
#include <cstdlib>

namespace {
template<typename E, typename T = int>
auto rejects(std::string_view text, T min = std::numeric_limits<T>::min(), T max = std::numeric_limits<T>::max()) {
    try {
        get_integer<T>(text, min, max);
    }
    catch(const E& e) {
        return true;
    }
    return false;
}
} // end namespace

auto main([[maybe_unused]] int argc, [[maybe_unused]] char **argv) -> int {
    try {
        assert(get_integer("123") == 123);
        assert(get_integer("-42") == -42);
        assert(get_integer(" 7 ") == 7);
        assert(get_integer("-0") == 0);
        assert(get_integer("-2147483648") == -2147483647 - 1);
        assert(get_integer("2147483647") == 2147483647);
        assert(get_integer<short>("-300") == -300);

        assert(rejects<std::invalid_argument>("12x"));
        assert(rejects<std::invalid_argument>(""));
        assert(rejects<std::invalid_argument>("-"));
        assert(rejects<std::overflow_error>("2147483648"));
        assert(rejects<std::overflow_error>("-2147483649"));
        assert(get_integer<int64_t>("-9223372036854775808") == std::numeric_limits<int64_t>::min());
        assert(get_integer<int64_t>("9223372036854775807") == std::numeric_limits<int64_t>::max());
        assert((rejects<std::overflow_error, int64_t>("9223372036854775808")));
        assert((rejects<std::overflow_error, int64_t>("20000000000000000000")));
        assert((rejects<std::overflow_error, int64_t>("99999999999999999999")));
        assert(rejects<std::out_of_range>("-5", 0, 10));
        assert(rejects<std::out_of_range>("-1", 1, 10));
        assert(rejects<std::overflow_error>("9", 0, 8));
        assert(rejects<std::invalid_argument>("\xc3\xa9"));
        assert(get_integer("10", 0, 10) == 10);

        auto values = get_integers("-1, 0, 1,2 -1");
        assert(values == std::vector<int>({-1, 0, 1, 2, -1}));
        assert(get_integers("").empty());
        assert(get_integers("  ").empty());
    }
    catch(std::exception& e) {
        printf("Error: %s\n", e.what());
        ::exit(-1);
    }
}
