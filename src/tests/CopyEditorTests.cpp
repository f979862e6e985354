// SPDX-License-Identifier: Apache-2.0
#include <net/Http.hpp>
#include <text/LanguageToolClient.hpp>
#include <text/TextCorrector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>
#include <vector>

using namespace textmic;

TEST_CASE("applyCorrections replaces ranges from the end backwards", "[copyedit]")
{
    auto const corrections = std::vector<Correction> {
        { .offset = 0, .length = 4, .replacement = "This" },
        { .offset = 8, .length = 1, .replacement = "an" },
    };
    CHECK(applyCorrections("Thsi is a example", corrections) == "This is an example");
}

TEST_CASE("applyCorrections skips out of range corrections", "[copyedit]")
{
    auto const corrections = std::vector<Correction> {
        { .offset = 20, .length = 2, .replacement = "x" },
        { .offset = 3, .length = 10, .replacement = "y" },
    };
    CHECK(applyCorrections("short", corrections) == "short");
}

TEST_CASE("applyCorrections skips overlapping corrections", "[copyedit]")
{
    auto const corrections = std::vector<Correction> {
        { .offset = 0, .length = 5, .replacement = "Hi" },
        { .offset = 3, .length = 5, .replacement = "p there" },
    };
    CHECK(applyCorrections("Hello world", corrections) == "Help thererld");
}

TEST_CASE("applyCorrections without corrections returns the text", "[copyedit]")
{
    CHECK(applyCorrections("unchanged", {}) == "unchanged");
}

TEST_CASE("utf16ToByteCorrections shifts ranges past non-ASCII characters", "[copyedit]")
{
    auto const text = std::string_view { "Caf\u00e9 is a nice place  to be" };
    auto const corrections = std::vector<Correction> { { .offset = 20, .length = 2, .replacement = " " } };

    auto const converted = utf16ToByteCorrections(text, corrections);
    REQUIRE(converted.size() == 1);
    CHECK(converted[0].offset == 21);
    CHECK(converted[0].length == 2);
    CHECK(applyCorrections(text, converted) == "Caf\u00e9 is a nice place to be");
}

TEST_CASE("utf16ToByteCorrections counts characters outside the BMP as two units", "[copyedit]")
{
    // U+1F600 is four bytes in UTF-8 and a surrogate pair in UTF-16.
    auto const text = std::string_view { "\xF0\x9F\x98\x80 teh cat" };
    auto const corrections = std::vector<Correction> {
        { .offset = 3, .length = 3, .replacement = "the" },
        { .offset = 1, .length = 1, .replacement = "x" },
        { .offset = 9, .length = 5, .replacement = "y" },
    };

    auto const converted = utf16ToByteCorrections(text, corrections);
    REQUIRE(converted.size() == 1);
    CHECK(converted[0].offset == 5);
    CHECK(applyCorrections(text, converted) == "\xF0\x9F\x98\x80 the cat");
}

TEST_CASE("parseLanguageToolMatches takes the first replacement of each match", "[copyedit]")
{
    auto corrections = parseLanguageToolMatches(R"({
        "software": {"name": "LanguageTool"},
        "matches": [
            {"offset": 0, "length": 4, "replacements": [{"value": "This"}, {"value": "Thai"}]},
            {"offset": 8, "length": 1, "replacements": []},
            {"offset": 10, "length": 7, "replacements": [{"value": "example"}]}
        ]
    })");

    REQUIRE(corrections.has_value());
    REQUIRE(corrections->size() == 2);
    CHECK((*corrections)[0].offset == 0);
    CHECK((*corrections)[0].length == 4);
    CHECK((*corrections)[0].replacement == "This");
    CHECK((*corrections)[1].offset == 10);
    CHECK((*corrections)[1].replacement == "example");
}

TEST_CASE("parseLanguageToolMatches handles responses without matches", "[copyedit]")
{
    auto empty = parseLanguageToolMatches(R"({"matches": []})");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());

    auto missing = parseLanguageToolMatches("{}");
    REQUIRE(missing.has_value());
    CHECK(missing->empty());

    CHECK(!parseLanguageToolMatches("<html>").has_value());
}

TEST_CASE("formEncode escapes reserved characters", "[copyedit]")
{
    CHECK(http::formEncode("Hello world") == "Hello%20world");
    CHECK(http::formEncode("a&b=c") == "a%26b%3Dc");
    CHECK(http::formEncode("en-US") == "en-US");
    CHECK(http::formEncode("caf\xC3\xA9") == "caf%C3%A9");
    CHECK(http::formEncode("") == "");
}
