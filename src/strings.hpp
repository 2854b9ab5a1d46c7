// Copyright (C) 2020 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_STRINGS_HPP_
#define TANDEM_STRINGS_HPP_

#include <type_traits>
#include <string>
#include <string_view>
#include <iterator>
#include <vector>

namespace tandem {
template <typename T>
inline constexpr bool is_string_type_v = std::is_convertible_v<T, std::string_view>;

// Reads the same front to back as back to front, element for element. No
// case folding or whitespace skipping; an empty sequence is a palindrome.
constexpr auto is_palindrome(std::string_view text) noexcept {
    if(text.empty())
        return true;

    std::size_t left = 0, right = text.size() - 1;
    while(left < right) {
        if(text[left] != text[right])
            return false;
        ++left;
        --right;
    }
    return true;
}

template <typename Container, typename = std::enable_if_t<!is_string_type_v<Container>>>
auto is_palindrome(const Container& chars) {
    auto left = std::begin(chars);
    auto right = std::end(chars);
    if(left == right)
        return true;

    --right;
    while(left < right) {
        if(!(*left == *right))
            return false;
        ++left;
        --right;
    }
    return true;
}

constexpr auto strip(std::string_view str, std::string_view space = " \t\f\v\n\r") {
    auto first = str.find_first_not_of(space);
    if(first == std::string_view::npos)
        return str.substr(0, 0);
    auto last = str.find_last_not_of(space);
    return str.substr(first, last - first + 1);
}

constexpr auto unquote(std::string_view str, std::string_view pairs = R"(""'')") {
    if(str.size() < 2)
        return str;
    auto pos = pairs.find_first_of(str[0]);
    if(pos == std::string_view::npos || (pos & 0x01))
        return str;
    if(str.back() != pairs[pos + 1])
        return str;
    return str.substr(1, str.size() - 2);
}

inline auto split(std::string_view str, std::string_view delim = " ") {
    std::vector<std::string> result;
    std::size_t prev = 0;
    auto current = str.find_first_of(delim);
    while(current != std::string_view::npos) {
        result.emplace_back(str.substr(prev, current - prev));
        prev = current + 1;
        current = str.find_first_of(delim, prev);
    }
    result.emplace_back(str.substr(prev));
    return result;
}
} // end namespace
#endif
