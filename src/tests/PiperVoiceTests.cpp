// SPDX-License-Identifier: Apache-2.0
#include <tts/PiperSpeechBackend.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace textmic;

namespace
{

/// @brief Temporary directory holding fake voice models, removed on destruction.
struct VoiceDirectory
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "textmic_piper_voices_test";

    VoiceDirectory()
    {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~VoiceDirectory() { std::filesystem::remove_all(path); }

    auto addVoice(std::string_view id, std::string_view json) const -> std::string
    {
        auto const model = path / (std::string(id) + ".onnx");
        std::ofstream(model) << "onnx";
        std::ofstream(model.string() + ".json") << json;
        return model.string();
    }
};

} // namespace

TEST_CASE("loadPiperVoice reads dataset name and sample rate", "[piper]")
{
    auto const dir = VoiceDirectory {};
    auto const model =
        dir.addVoice("en_US-lessac-medium", R"({"dataset": "lessac", "audio": {"sample_rate": 16000}})");

    auto voice = loadPiperVoice(model);
    REQUIRE(voice.has_value());
    CHECK(voice->id == "en_US-lessac-medium");
    CHECK(voice->name == "lessac");
    CHECK(voice->sampleRate == 16000);
    CHECK(voice->modelPath == model);
}

TEST_CASE("loadPiperVoice defaults the name and sample rate", "[piper]")
{
    auto const dir = VoiceDirectory {};
    auto const model = dir.addVoice("de_DE-thorsten-low", "{}");

    auto voice = loadPiperVoice(model);
    REQUIRE(voice.has_value());
    CHECK(voice->name == "de_DE-thorsten-low");
    CHECK(voice->sampleRate == 22050);
}

TEST_CASE("loadPiperVoice fails without a JSON config", "[piper]")
{
    auto voice = loadPiperVoice("/nonexistent/voice.onnx");
    REQUIRE(!voice.has_value());
    CHECK(voice.error().code == ErrorCode::ConfigError);
}

TEST_CASE("scanPiperVoices lists models with configs sorted by id", "[piper]")
{
    auto const dir = VoiceDirectory {};
    dir.addVoice("en_US-ryan-high", R"({"dataset": "ryan"})");
    dir.addVoice("en_GB-alba-medium", R"({"dataset": "alba"})");
    std::ofstream(dir.path / "orphan.onnx") << "no config";
    std::ofstream(dir.path / "notes.txt") << "ignored";

    auto const voices = scanPiperVoices(dir.path.string());
    REQUIRE(voices.size() == 2);
    CHECK(voices[0].id == "en_GB-alba-medium");
    CHECK(voices[1].id == "en_US-ryan-high");
}

TEST_CASE("scanPiperVoices of a missing directory is empty", "[piper]")
{
    CHECK(scanPiperVoices("/nonexistent/voices").empty());
}

TEST_CASE("matchPiperVoice matches id or name ignoring case", "[piper]")
{
    auto const voices = std::vector<PiperVoice> {
        { .id = "en_US-lessac-medium", .name = "lessac", .modelPath = "a.onnx", .sampleRate = 22050 },
        { .id = "en_US-ryan-high", .name = "Ryan", .modelPath = "b.onnx", .sampleRate = 22050 },
    };

    CHECK(matchPiperVoice(voices, "LESSAC") == 0);
    CHECK(matchPiperVoice(voices, "ryan") == 1);
    CHECK(matchPiperVoice(voices, "high") == 1);
    CHECK(!matchPiperVoice(voices, "alloy").has_value());
}

TEST_CASE("PiperSpeechBackend creation fails without voices", "[piper]")
{
    auto const dir = VoiceDirectory {};
    auto backend = PiperSpeechBackend::create(PiperSpeechConfig { .voicesDir = dir.path.string() });
    REQUIRE(!backend.has_value());
    CHECK(backend.error().code == ErrorCode::ConfigError);
}
