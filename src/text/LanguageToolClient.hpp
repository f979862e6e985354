// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <text/TextCorrector.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace textmic
{

struct LanguageToolConfig
{
    /// @brief Server root, e.g. "http://localhost:8081". The client appends "/v2/check".
    std::string url;
    std::string language = "en-US";
    long timeoutSeconds = 10;
};

/// @brief Extracts the first suggested replacement of every match in a `/v2/check` response.
///
/// Matches without replacements are ignored. Offsets and lengths stay in UTF-16 code
/// units, as the server counts them; see utf16ToByteCorrections().
/// @return The corrections in response order, or an InvalidArgument error for malformed JSON.
[[nodiscard]] auto parseLanguageToolMatches(std::string_view responseBody) -> Result<std::vector<Correction>>;

/// @brief TextCorrector backed by a LanguageTool HTTP server.
class LanguageToolClient final: public TextCorrector
{
  public:
    explicit LanguageToolClient(LanguageToolConfig config);

    [[nodiscard]] auto correct(std::string_view text) -> Result<std::string> override;

  private:
    LanguageToolConfig _config;
};

} // namespace textmic
