//
// Util.hpp
//

#ifndef CAROQUEST_UTIL_HPP
#define CAROQUEST_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>

namespace caroquest::core::util
{
    template <std::ranges::input_range R, typename T>
    inline auto Contains(R const& r, T const& v) -> bool
    {
        return std::ranges::find(r, v) != std::ranges::end(r);
    }

    inline auto Trim(std::string_view s) -> std::string
    {
        auto const is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return std::string{s};
    }

    inline auto ToUpper(std::string_view s) -> std::string
    {
        std::string out{s};
        std::ranges::transform(out, out.begin(), [](unsigned char c)
        {
            return static_cast<char>(std::toupper(c));
        });
        return out;
    }
}

#endif //CAROQUEST_UTIL_HPP
