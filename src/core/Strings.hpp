// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace textmic
{

/// @brief Strips leading and trailing ASCII whitespace.
[[nodiscard]] inline auto trimText(std::string_view text) -> std::string
{
    constexpr auto Whitespace = std::string_view { " \t\n\r\f\v" };
    auto const start = text.find_first_not_of(Whitespace);
    if (start == std::string_view::npos)
        return {};
    auto const end = text.find_last_not_of(Whitespace);
    return std::string(text.substr(start, end - start + 1));
}

/// @brief ASCII lower-casing, for case-insensitive name matching.
[[nodiscard]] inline auto toLower(std::string_view text) -> std::string
{
    auto s = std::string(text);
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// @brief Returns true if @p haystack contains @p needle, ignoring ASCII case.
[[nodiscard]] inline auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

/// @brief Maps UTF-16 code unit positions in UTF-8 @p text to byte positions.
///
/// Element @c i is the byte offset of unit @c i; the last element is text.size().
/// Positions between the two halves of a surrogate pair map to std::string_view::npos.
/// Malformed bytes count as one unit each.
[[nodiscard]] inline auto utf16ByteOffsets(std::string_view text) -> std::vector<std::size_t>
{
    auto offsets = std::vector<std::size_t> { 0 };
    auto i = std::size_t { 0 };
    while (i < text.size())
    {
        auto const lead = static_cast<unsigned char>(text[i]);
        auto const length = lead >= 0xF0 ? 4U : lead >= 0xE0 ? 3U : lead >= 0xC0 ? 2U : 1U;
        i = std::min(i + length, text.size());
        if (length == 4)
            offsets.push_back(std::string_view::npos);
        offsets.push_back(i);
    }
    return offsets;
}

} // namespace textmic
