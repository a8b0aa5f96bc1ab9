#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief Returns the ASCII lower case version of the passed string.
     */
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result{input};
        std::ranges::transform(result, result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    /**
     * @brief Case insensitive comparison of two ASCII strings.
     */
    inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    {
        return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
    }
}
