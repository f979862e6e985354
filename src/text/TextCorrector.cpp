// SPDX-License-Identifier: Apache-2.0
#include "TextCorrector.hpp"

#include <core/Log.hpp>
#include <core/Strings.hpp>

#include <algorithm>
#include <vector>

namespace textmic
{

auto applyCorrections(std::string_view text, std::span<const Correction> corrections) -> std::string
{
    auto ordered = std::vector<Correction>(corrections.begin(), corrections.end());
    std::ranges::stable_sort(ordered, std::ranges::greater {}, &Correction::offset);

    auto result = std::string(text);
    auto limit = text.size();
    for (auto const& correction: ordered)
    {
        if (correction.offset > text.size() || correction.length > text.size() - correction.offset)
        {
            log::debug("Skipping out of range correction at {}+{}", correction.offset, correction.length);
            continue;
        }
        if (correction.offset + correction.length > limit)
        {
            log::debug("Skipping overlapping correction at {}+{}", correction.offset, correction.length);
            continue;
        }

        result.replace(correction.offset, correction.length, correction.replacement);
        limit = correction.offset;
    }
    return result;
}

auto utf16ToByteCorrections(std::string_view text, std::span<const Correction> corrections)
    -> std::vector<Correction>
{
    auto const offsets = utf16ByteOffsets(text);
    auto const byteOffset = [&](std::size_t unit) {
        return unit < offsets.size() ? offsets[unit] : std::string_view::npos;
    };

    auto result = std::vector<Correction> {};
    result.reserve(corrections.size());
    for (auto const& correction: corrections)
    {
        auto const begin = byteOffset(correction.offset);
        auto const end = correction.length > offsets.size() ? std::string_view::npos
                                                            : byteOffset(correction.offset + correction.length);
        if (begin == std::string_view::npos || end == std::string_view::npos)
        {
            log::debug("Dropping correction at unit {}+{}", correction.offset, correction.length);
            continue;
        }
        result.push_back(Correction { .offset = begin, .length = end - begin, .replacement = correction.replacement });
    }
    return result;
}

} // namespace textmic
