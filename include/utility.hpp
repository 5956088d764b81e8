#ifndef UTILITY_H
#define UTILITY_H

#include <string>
#include <string_view>
#include <numeric>
#include <ranges>
#include <vector>
#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    // strips leading and trailing whitespace
    inline auto trim(std::string_view s) -> std::string_view
    {
        constexpr std::string_view whitespace = " \t\r\n\v\f";
        const auto first = s.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
        {
            return {};
        }
        const auto last = s.find_last_not_of(whitespace);
        return s.substr(first, last - first + 1);
    }

    // whitespace separated tokens, empty tokens dropped
    inline auto split_whitespace(std::string_view s) -> std::vector<std::string_view>
    {
        std::vector<std::string_view> tokens;
        constexpr std::string_view whitespace = " \t\r\n\v\f";
        std::size_t pos = s.find_first_not_of(whitespace);
        while (pos != std::string_view::npos)
        {
            const auto end = s.find_first_of(whitespace, pos);
            tokens.push_back(s.substr(pos, end == std::string_view::npos ? end : end - pos));
            pos = s.find_first_not_of(whitespace, end);
        }
        return tokens;
    }

    // number of code points in a UTF-8 string, used for column widths
    inline auto display_width(std::string_view s) -> std::size_t
    {
        return static_cast<std::size_t>(ranges::count_if(s, [](char c){
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }
}

#endif
