#pragma once

#include <string_view>

namespace Utility::Algorithm
{
    inline std::string_view trim(std::string_view input)
    {
        constexpr std::string_view whitespace = " \t\r\n";

        const auto first = input.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
            return {};
        const auto last = input.find_last_not_of(whitespace);
        return input.substr(first, last - first + 1);
    }
}
