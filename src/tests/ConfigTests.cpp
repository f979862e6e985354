// SPDX-License-Identifier: Apache-2.0
#include <textmic/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

using namespace textmic;

TEST_CASE("defaultConfigPath ends with textmic/config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(!defaultConfigDir().empty());
    CHECK(path.ends_with("config.json"));
    CHECK(path.find("textmic") != std::string::npos);
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.voice == "alloy");
    CHECK(config.sampleRate == 24000);
    CHECK(config.recordSeconds == 5);
    CHECK(!config.headphoneDevice.has_value());
    CHECK(!config.micDevice.has_value());
    CHECK(!config.apiKey.has_value());
    CHECK(!config.copyEdit);
}

TEST_CASE("parseConfig reads the flat key set", "[config]")
{
    auto config = parseConfig(R"({
        "headphone_device": 2,
        "mic_device": 5,
        "voice": "nova",
        "api_key": "sk-test",
        "sample_rate": 22050,
        "piper_voices_dir": "/opt/voices",
        "whisper_model": "/opt/ggml-base.en.bin",
        "language_tool_url": "http://localhost:8081",
        "copy_edit": true,
        "record_seconds": 8
    })");

    REQUIRE(config.has_value());
    CHECK(config->headphoneDevice == 2);
    CHECK(config->micDevice == 5);
    CHECK(config->voice == "nova");
    CHECK(config->apiKey == "sk-test");
    CHECK(config->sampleRate == 22050);
    CHECK(config->piperVoicesDir == "/opt/voices");
    CHECK(config->whisperModel == "/opt/ggml-base.en.bin");
    CHECK(config->languageToolUrl == "http://localhost:8081");
    CHECK(config->copyEdit);
    CHECK(config->recordSeconds == 8);
}

TEST_CASE("parseConfig accepts null for optional values", "[config]")
{
    auto config = parseConfig(R"({"headphone_device": null, "mic_device": null, "api_key": null})");
    REQUIRE(config.has_value());
    CHECK(!config->headphoneDevice.has_value());
    CHECK(!config->micDevice.has_value());
    CHECK(!config->apiKey.has_value());
    CHECK(config->voice == "alloy");
}

TEST_CASE("parseConfig treats an empty api_key as absent", "[config]")
{
    auto config = parseConfig(R"({"api_key": ""})");
    REQUIRE(config.has_value());
    CHECK(!config->apiKey.has_value());
}

TEST_CASE("parseConfig replaces a non-positive sample rate with the default", "[config]")
{
    auto config = parseConfig(R"({"sample_rate": 0})");
    REQUIRE(config.has_value());
    CHECK(config->sampleRate == 24000);
}

TEST_CASE("parseConfig rejects malformed documents", "[config]")
{
    auto invalid = parseConfig("{ not json");
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::ConfigError);

    auto array = parseConfig("[1, 2]");
    REQUIRE(!array.has_value());
    CHECK(array.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile and loadConfigFromFile preserve settings", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "textmic_config_test";
    std::filesystem::remove_all(dir);
    auto const path = (dir / "nested" / "config.json").string();

    auto config = AppConfig {};
    config.headphoneDevice = 1;
    config.voice = "onyx";
    config.languageToolUrl = "http://localhost:8081";
    config.copyEdit = true;

    REQUIRE(saveConfigToFile(path, config).has_value());

    auto loaded = loadConfigFromFile(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->headphoneDevice == 1);
    CHECK(!loaded->micDevice.has_value());
    CHECK(!loaded->apiKey.has_value());
    CHECK(loaded->voice == "onyx");
    CHECK(loaded->languageToolUrl == "http://localhost:8081");
    CHECK(loaded->copyEdit);

    // Optional values are written as explicit nulls
    auto file = std::ifstream(path);
    auto const content = std::string(std::istreambuf_iterator<char>(file), {});
    CHECK(content.find("\"mic_device\": null") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST_CASE("saveSessionConfig keeps the API key of the file", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "textmic_session_config_test";
    std::filesystem::remove_all(dir);
    auto const path = (dir / "config.json").string();

    auto session = AppConfig {};
    session.voice = "echo";
    session.apiKey = "sk-from-command-line";

    SECTION("no key stored")
    {
        REQUIRE(saveSessionConfig(path, session, std::nullopt).has_value());
        auto loaded = loadConfigFromFile(path);
        REQUIRE(loaded.has_value());
        CHECK(!loaded->apiKey.has_value());
        CHECK(loaded->voice == "echo");
    }

    SECTION("key stored in the file")
    {
        REQUIRE(saveSessionConfig(path, session, std::string("sk-from-file")).has_value());
        auto loaded = loadConfigFromFile(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->apiKey == "sk-from-file");
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("toPipelineSettings copies the pipeline values", "[config]")
{
    auto config = AppConfig {};
    config.headphoneDevice = 3;
    config.micDevice = 6;
    config.apiKey = "sk-test";
    config.sampleRate = 16000;

    auto const settings = toPipelineSettings(config);
    CHECK(settings.headphoneDevice == 3);
    CHECK(settings.micDevice == 6);
    CHECK(settings.apiKey == "sk-test");
    CHECK(settings.sampleRateHint == 16000);
}

TEST_CASE("ConfigStore snapshots are independent copies", "[config]")
{
    auto store = ConfigStore {};
    auto const before = store.snapshot();

    store.update([](AppConfig& config) { config.voice = "fable"; });

    CHECK(before.voice == "alloy");
    CHECK(store.snapshot().voice == "fable");
}
