// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace textmic
{

/// @brief One suggested replacement of a character range.
struct Correction
{
    std::size_t offset = 0;
    std::size_t length = 0;
    std::string replacement;
};

/// @brief Grammar and style correction applied to text before it is spoken.
class TextCorrector
{
  public:
    virtual ~TextCorrector() = default;

    /// @brief Returns the corrected text. Blocking.
    [[nodiscard]] virtual auto correct(std::string_view text) -> Result<std::string> = 0;
};

/// @brief Applies @p corrections to @p text, starting with the one closest to the end.
///
/// Corrections reaching past the end of the text, or overlapping one already applied,
/// are skipped. Offsets and lengths are byte positions in @p text.
[[nodiscard]] auto applyCorrections(std::string_view text, std::span<const Correction> corrections)
    -> std::string;

/// @brief Converts corrections counted in UTF-16 code units into byte positions in @p text.
///
/// Corrections starting or ending outside the text, or inside a surrogate pair, are dropped.
[[nodiscard]] auto utf16ToByteCorrections(std::string_view text, std::span<const Correction> corrections)
    -> std::vector<Correction>;

} // namespace textmic
