// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace pagent
{

/// @brief Returns @p text without leading and trailing whitespace.
[[nodiscard]] inline auto trim(std::string_view text) -> std::string_view
{
    auto const isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

[[nodiscard]] inline auto toLower(std::string_view text) -> std::string
{
    auto result = std::string(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// @brief Case-insensitive (ASCII) substring test. An empty needle matches everything.
[[nodiscard]] inline auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

} // namespace pagent
