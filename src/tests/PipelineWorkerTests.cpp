// SPDX-License-Identifier: Apache-2.0
#include <pipeline/PipelineWorker.hpp>

#include <catch2/catch_test_macros.hpp>

#include "Mocks.hpp"

#include <algorithm>
#include <format>
#include <ranges>

using namespace textmic;
using namespace textmic::test;

namespace
{

/// @brief A worker wired to mock backends and outputs.
struct Fixture
{
    MockSpeechBackend* remote = nullptr;
    MockSpeechBackend* local = nullptr;
    std::shared_ptr<MockAudioOutput> output = std::make_shared<MockAudioOutput>();
    std::unique_ptr<SpeechSynthesizer> synthesizer;
    std::unique_ptr<PlaybackFanOut> fanOut;
    StatusRecorder recorder;
    std::unique_ptr<PipelineWorker> worker;

    Fixture()
    {
        auto remoteBackend = std::make_unique<MockSpeechBackend>("remote");
        auto localBackend = std::make_unique<MockSpeechBackend>("local");
        remote = remoteBackend.get();
        local = localBackend.get();
        synthesizer = std::make_unique<SpeechSynthesizer>(std::move(remoteBackend), std::move(localBackend));
        fanOut = std::make_unique<PlaybackFanOut>(output);
        worker = std::make_unique<PipelineWorker>(*synthesizer, *fanOut, recorder.callback());
    }

    ~Fixture() { worker->shutdown(); }
};

} // namespace

TEST_CASE("PipelineWorker starts idle", "[pipeline]")
{
    auto fixture = Fixture {};
    CHECK(fixture.worker->status().state == PipelineState::Idle);
    CHECK(fixture.worker->pendingJobs() == 0);
}

TEST_CASE("PipelineWorker speaks one job end to end", "[pipeline]")
{
    auto fixture = Fixture {};
    auto const settings = PipelineSettings { .headphoneDevice = 1 };

    REQUIRE(fixture.worker->submit("Hello world", "alloy", settings));
    fixture.worker->flush();

    CHECK(fixture.recorder.states()
          == std::vector { PipelineState::Synthesizing, PipelineState::Playing, PipelineState::Idle });

    REQUIRE(fixture.local->callCount() == 1);
    CHECK(fixture.local->calls[0].text == "Hello world");
    CHECK(fixture.local->calls[0].voiceId == "alloy");
    CHECK(fixture.remote->callCount() == 0);

    REQUIRE(fixture.output->played.size() == 1);
    CHECK(fixture.output->played[0].target.index == 1);
    CHECK(fixture.output->played[0].channels == 2);
    CHECK(fixture.worker->status().state == PipelineState::Idle);
}

TEST_CASE("PipelineWorker rejects blank text without a status change", "[pipeline]")
{
    auto fixture = Fixture {};

    CHECK(!fixture.worker->submit("", "alloy", {}));
    CHECK(!fixture.worker->submit("   \t\n", "alloy", {}));
    fixture.worker->flush();

    CHECK(fixture.recorder.statuses().empty());
    CHECK(fixture.local->callCount() == 0);
}

TEST_CASE("PipelineWorker processes jobs in submission order", "[pipeline]")
{
    auto fixture = Fixture {};

    for (auto const* text: { "one", "two", "three", "four" })
        REQUIRE(fixture.worker->submit(text, "echo", {}));
    fixture.worker->flush();

    CHECK(fixture.local->texts() == std::vector<std::string> { "one", "two", "three", "four" });
    CHECK(fixture.output->playedCount() == 4);
    CHECK(fixture.recorder.states().back() == PipelineState::Idle);
}

TEST_CASE("PipelineWorker synthesizes before playing within a job", "[pipeline]")
{
    auto fixture = Fixture {};

    REQUIRE(fixture.worker->submit("first", "alloy", {}));
    REQUIRE(fixture.worker->submit("second", "alloy", {}));
    fixture.worker->flush();

    auto states = fixture.recorder.states();
    std::erase(states, PipelineState::Queued);
    std::erase(states, PipelineState::Idle);
    CHECK(states
          == std::vector { PipelineState::Synthesizing,
                           PipelineState::Playing,
                           PipelineState::Synthesizing,
                           PipelineState::Playing });
}

TEST_CASE("PipelineWorker never reports Queued for a job that already started", "[pipeline]")
{
    auto fixture = Fixture {};
    fixture.local->audio = makeTone(100);

    for (auto i = 0; i < 200; ++i)
        REQUIRE(fixture.worker->submit(std::format("job {}", i), "alloy", {}));
    fixture.worker->flush();

    // Every Queued belongs to a job whose Synthesizing comes later, so no tail of the
    // sequence may hold more Queued than Synthesizing entries.
    auto const states = fixture.recorder.states();
    auto queued = 0;
    auto synthesizing = 0;
    for (auto const state: states | std::views::reverse)
    {
        if (state == PipelineState::Queued)
            ++queued;
        else if (state == PipelineState::Synthesizing)
            ++synthesizing;
        REQUIRE(queued <= synthesizing);
    }

    CHECK(synthesizing == 200);
    CHECK(states.back() == PipelineState::Idle);
    CHECK(fixture.worker->status().state == PipelineState::Idle);
}

TEST_CASE("PipelineWorker publishes Error and keeps running after a synthesis failure", "[pipeline]")
{
    auto fixture = Fixture {};
    fixture.local->failWith = "model missing";

    REQUIRE(fixture.worker->submit("broken", "alloy", {}));
    fixture.worker->flush();

    auto const statuses = fixture.recorder.statuses();
    REQUIRE(statuses.size() == 3);
    CHECK(statuses[0].state == PipelineState::Synthesizing);
    CHECK(statuses[1].state == PipelineState::Error);
    CHECK(statuses[1].message.find("model missing") != std::string::npos);
    CHECK(statuses[2].state == PipelineState::Idle);
    CHECK(fixture.output->playedCount() == 0);

    fixture.local->failWith.reset();
    REQUIRE(fixture.worker->submit("working", "alloy", {}));
    fixture.worker->flush();
    CHECK(fixture.output->playedCount() == 1);
}

TEST_CASE("PipelineWorker replaces unknown voices with the default", "[pipeline]")
{
    auto fixture = Fixture {};

    REQUIRE(fixture.worker->submit("Hello", "robot", {}));
    fixture.worker->flush();

    REQUIRE(fixture.local->callCount() == 1);
    CHECK(fixture.local->calls[0].voiceId == "alloy");
}

TEST_CASE("PipelineWorker uses the credentials of the submit-time settings", "[pipeline]")
{
    auto fixture = Fixture {};

    REQUIRE(fixture.worker->submit("Hello", "alloy", PipelineSettings { .apiKey = "sk-test" }));
    fixture.worker->flush();

    REQUIRE(fixture.remote->callCount() == 1);
    CHECK(fixture.remote->calls[0].credentials == "sk-test");
    CHECK(fixture.local->callCount() == 0);
}

TEST_CASE("PipelineWorker carries the sample rate hint of the submit-time settings", "[pipeline]")
{
    auto fixture = Fixture {};

    REQUIRE(fixture.worker->submit("Hello", "alloy", PipelineSettings { .apiKey = "sk-test", .sampleRateHint = 16000 }));
    fixture.worker->flush();

    REQUIRE(fixture.remote->callCount() == 1);
    CHECK(fixture.remote->calls[0].sampleRateHint == 16000);
}

TEST_CASE("PipelineWorker speaks with the local backend when the remote one throws", "[pipeline]")
{
    auto fixture = Fixture {};
    fixture.remote->throwWith = "invalid UTF-8 byte";

    REQUIRE(fixture.worker->submit("caf\xE9", "alloy", PipelineSettings { .apiKey = "sk-test" }));
    fixture.worker->flush();

    CHECK(fixture.local->callCount() == 1);
    CHECK(fixture.recorder.states()
          == std::vector { PipelineState::Synthesizing, PipelineState::Playing, PipelineState::Idle });
}

TEST_CASE("PipelineWorker plays to both configured devices", "[pipeline]")
{
    auto fixture = Fixture {};
    auto const settings = PipelineSettings { .headphoneDevice = 1, .micDevice = 4 };

    REQUIRE(fixture.worker->submit("Hello", "alloy", settings));
    fixture.worker->flush();

    REQUIRE(fixture.output->played.size() == 2);
    auto indices = std::vector<int> {};
    for (auto const& played: fixture.output->played)
        indices.push_back(played.target.index.value_or(-1));
    std::ranges::sort(indices);
    CHECK(indices == std::vector { 1, 4 });
}

TEST_CASE("PipelineWorker refuses jobs after shutdown", "[pipeline]")
{
    auto fixture = Fixture {};
    fixture.worker->shutdown();

    CHECK(!fixture.worker->submit("late", "alloy", {}));
    CHECK(fixture.local->callCount() == 0);
}

TEST_CASE("PipelineSettings targets lists headphone then mic without duplicates", "[pipeline]")
{
    CHECK(PipelineSettings {}.targets().empty());

    auto const both = PipelineSettings { .headphoneDevice = 2, .micDevice = 5 }.targets();
    REQUIRE(both.size() == 2);
    CHECK(both[0].index == 2);
    CHECK(both[1].index == 5);

    auto const same = PipelineSettings { .headphoneDevice = 3, .micDevice = 3 }.targets();
    CHECK(same.size() == 1);

    auto const micOnly = PipelineSettings { .micDevice = 7 }.targets();
    REQUIRE(micOnly.size() == 1);
    CHECK(micOnly[0].index == 7);
}
