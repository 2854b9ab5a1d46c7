// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_TRIPLETS_HPP_
#define TANDEM_TRIPLETS_HPP_

#include <array>
#include <vector>
#include <algorithm>
#include <iterator>
#include <type_traits>
#include <initializer_list>
#include <cstdint>

namespace tandem {
template <typename T>
using triplet = std::array<T, 3>;

template <typename T>
constexpr auto triplet_sum(const triplet<T>& values) {
    return std::intmax_t(values[0]) + std::intmax_t(values[1]) + std::intmax_t(values[2]);
}

// Every multiset of three values from the input that sums to zero, once each,
// each triplet in ascending order. The input is copied and sorted privately,
// so any container of signed integers will do.
template <typename Container>
auto find_zero_sum_triplets(const Container& input) {
    using T = std::decay_t<typename Container::value_type>;
    static_assert(std::is_integral_v<T> && !std::is_unsigned_v<T>, "T must be signed integer");

    std::vector<T> values(std::begin(input), std::end(input));
    std::vector<triplet<T>> result;
    auto size = values.size();
    if(size < 3)
        return result;

    std::sort(values.begin(), values.end());
    for(std::size_t anchor = 0; anchor < size - 2; ++anchor) {
        const auto value = values[anchor];
        if(value > 0)
            break;

        if(anchor > 0 && value == values[anchor - 1])
            continue;

        auto left = anchor + 1, right = size - 1;
        while(left < right) {
            auto sum = std::intmax_t(value) + values[left] + values[right];
            if(sum == 0) {
                result.push_back({value, values[left], values[right]});
                while(left + 1 < right && values[left] == values[left + 1])
                    ++left;
                while(left < right - 1 && values[right] == values[right - 1])
                    --right;
                ++left;
                --right;
            }
            else if(sum < 0)
                ++left;
            else
                --right;
        }
    }
    return result;
}

template <typename T>
auto find_zero_sum_triplets(std::initializer_list<T> values) {
    return find_zero_sum_triplets(std::vector<T>(values));
}
} // end namespace
#endif
