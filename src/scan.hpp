// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_SCAN_HPP_
#define TANDEM_SCAN_HPP_

#include "strings.hpp"

#include <string_view>
#include <string>
#include <vector>
#include <stdexcept>
#include <limits>
#include <cstdint>
#include <cctype>

// low level utility scan functions
namespace tandem::scan {
inline auto value(std::string_view& text, uint64_t max = 2147483647) -> uint64_t {
    uint64_t value = 0;
    while(!text.empty() && isdigit(static_cast<unsigned char>(text.front()))) {
        auto digit = uint64_t(text.front() - '0');
        if(digit > max || value > (max - digit) / 10)
            break;
        value = value * 10 + digit;
        text.remove_prefix(1);
    }
    return value;
}
} // end namespace

namespace tandem {
template<typename T = int>
inline auto get_integer(std::string_view text, T min = std::numeric_limits<T>::min(), T max = std::numeric_limits<T>::max()) {
    static_assert(std::is_integral_v<T> && !std::is_unsigned_v<T> && sizeof(T) <= sizeof(int64_t), "Invalid integer type");

    text = strip(text);
    bool neg = false;
    if(!text.empty() && text.front() == '-') {
        if(min >= 0) throw std::out_of_range("Value cannot be negative");
        neg = true;
        text.remove_prefix(1);
    }

    if(text.empty() || !isdigit(static_cast<unsigned char>(text.front()))) throw std::invalid_argument("Value missing or invalid");

    // magnitude of the most negative value is one past max
    auto limit = neg ? uint64_t(-(int64_t(min) + 1)) + 1 : uint64_t(max);
    auto value = scan::value(text, limit);
    if(!text.empty() && isdigit(static_cast<unsigned char>(text.front()))) throw std::overflow_error("Value too big");
    if(!text.empty()) throw std::invalid_argument("Value invalid");
    if(neg) {
        auto nv = value ? -int64_t(value - 1) - 1 : int64_t(0);
        if(nv < int64_t(min)) throw std::out_of_range("Value too small");
        return T(nv);
    }

    if(int64_t(value) < int64_t(min)) throw std::out_of_range("Value too small");
    return T(value);
}

// Comma or space separated integers, such as "-1, 0, 1". Empty text gives an
// empty list; any malformed item throws like get_integer.
template<typename T = int>
inline auto get_integers(std::string_view text, std::string_view delim = ", \t") {
    std::vector<T> result;
    for(const auto& item : split(strip(text), delim)) {
        if(item.empty())
            continue;
        result.push_back(get_integer<T>(item));
    }
    return result;
}
} // end namespace
#endif
