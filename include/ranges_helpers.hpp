#ifndef RANGES_HELPERS_H
#define RANGES_HELPERS_H

#include <ranges>
#include <vector>
#include <iterator>
#include <algorithm>

#include "tl/expected.hpp"

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    namespace detail
    {
        // tag type picking the operator| overload below
        template <typename C>
        struct to_helper {};

        template <typename Container, std::ranges::range R>
            requires std::convertible_to<std::ranges::range_value_t<R>, typename Container::value_type>
        Container operator|(R &&r, to_helper<Container>)
        {
            return Container{r.begin(), r.end()};
        }
    }

    // collects a view into a container: `tokens | views::transform(f) | to<std::vector<T>>()`
    template <std::ranges::range Container>
        requires(!std::ranges::view<Container>)
    auto to()
    {
        return detail::to_helper<Container>{};
    }

    template<class>
    constexpr bool is_expected = false;

    template<class T, class E>
    constexpr bool is_expected<tl::expected<T, E>> = true;

    // turns a range of expected<T, E> into an expected<vector<T>, E>,
    // stopping at (and returning) the first error
    template<ranges::input_range R>
    requires is_expected<ranges::range_value_t<R>>
    auto to_expected(R&& r)
    {
        using expected_type = ranges::range_value_t<R>;
        using value_type = expected_type::value_type;
        using error_type = expected_type::error_type;
        using return_type = tl::expected<std::vector<value_type>, error_type>;

        auto values = r
            | views::take_while([](const auto& e) { return e.has_value(); })
            | views::transform([](const auto& e) { return e.value(); });

        std::vector<value_type> v;
        auto [it, out] = ranges::copy(values, std::back_inserter(v));
        if (it.base() == r.end())
        {
            return return_type(std::move(v));
        }
        return return_type(tl::unexpect, (*it.base()).error());
    }
}

#endif
