#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/ReflectionService.hpp"
#include "application/TeachingStepsService.hpp"
#include "application/capsule/SnapshotExporter.hpp"
#include "domain/DomainErrors.hpp"
#include "domain/gateway/GatewayErrors.hpp"
#include "infrastructure/AudioFileStore.hpp"
#include "infrastructure/CapsuleRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PatternStatRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ReasoningGatewayClient.hpp"
#include "infrastructure/TurnRepositoryFs.hpp"

using namespace reflectcore;
using namespace reflectcore::domain::gateway;
using reflectcore::application::ReflectionService;
using reflectcore::application::TeachingStepsService;
using reflectcore::application::TurnLifecycleService;
using reflectcore::domain::turn::CaptureContext;
using reflectcore::domain::turn::ReflectTool;
using reflectcore::infrastructure::ReasoningGatewayClient;

namespace fs = std::filesystem;

namespace {

// Scripted gateway: fails while `fail` is set, otherwise answers.
class MockGateway : public ReasoningGateway {
public:
    bool available = true;
    bool fail = false;
    int calls = 0;
    std::optional<ReflectRequest> lastReflect;
    std::optional<TalkRequest> lastTalk;
    StepsResponse steps;

    bool isAvailable() const override { return available; }

    ReflectResponse runTool(ReflectTool tool, const ReflectRequest& request) override {
        ++calls;
        lastReflect = request;
        if (fail) throw GatewayHttpError(500, "upstream error");
        return {"remote " + domain::turn::ToolToString(tool), "reflect-v3"};
    }

    TalkResponse talkItThrough(const TalkRequest& request) override {
        ++calls;
        lastTalk = request;
        if (fail) throw GatewayNetworkError("timeout");
        return {"reply " + std::to_string(calls), "resp-" + std::to_string(calls), "talk-v2"};
    }

    StepsResponse fetchSteps(StepsLane, const std::string&) override {
        ++calls;
        if (fail) throw GatewayDecodeError("bad body");
        return steps;
    }
};

} // namespace

int main() {
    std::cout << "[Test] Starting Reflection Gateway Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "reflectcore_test_reflection";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot / "audio");

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto lifecycle = std::make_shared<TurnLifecycleService>(
        std::make_shared<infrastructure::TurnRepositoryFs>(testRoot.string(), persistence),
        std::make_shared<infrastructure::AudioFileStore>((testRoot / "audio").string()));
    auto patterns = std::make_shared<application::learning::PatternLearningService>(
        std::make_shared<infrastructure::PatternStatRepositoryFs>(testRoot.string(), persistence));
    auto capsule = std::make_shared<application::capsule::CapsuleService>(
        std::make_shared<infrastructure::CapsuleRepositoryFs>(testRoot.string(), persistence), patterns);
    auto gateway = std::make_shared<MockGateway>();
    ReflectionService reflection(lifecycle, capsule, gateway, "reflectcore-test", "9.9.9");

    auto now = std::chrono::system_clock::now();
    std::string id = lifecycle->createTextImport("Too much on my plate this week", now, CaptureContext::Handheld);
    capsule->setPreference("output_style", "bullets");

    // Successful tool call is recorded with the capsule fingerprint.
    {
        auto result = reflection.runTool(id, ReflectTool::Options);
        assert(!result.usedFallback);
        assert(result.text == "remote options");
        assert(gateway->lastReflect);
        assert(gateway->lastReflect->text == "Too much on my plate this week");
        assert(gateway->lastReflect->client == "reflectcore-test");
        assert(gateway->lastReflect->capsule);

        auto expectedHash = application::capsule::SnapshotExporter::fingerprint(*gateway->lastReflect->capsule);
        auto t = lifecycle->get(id);
        assert(t->toolOutputs.count(ReflectTool::Options) == 1);
        assert(t->toolOutputs.at(ReflectTool::Options).promptVersion == "reflect-v3");
        assert(t->capsuleSnapshotHash == expectedHash);
        std::cout << "[PASS] Tool output recorded" << std::endl;
    }

    // Remote failure falls back locally and leaves the Turn untouched.
    {
        gateway->fail = true;
        auto result = reflection.runTool(id, ReflectTool::Questions);
        assert(result.usedFallback);
        assert(result.promptVersion == ReflectionService::kFallbackPromptVersion);
        assert(result.text == ReflectionService::FallbackFor(ReflectTool::Questions));
        assert(lifecycle->get(id)->toolOutputs.count(ReflectTool::Questions) == 0);

        gateway->available = false;
        int before = gateway->calls;
        assert(reflection.runTool(id, ReflectTool::Reflect).usedFallback);
        assert(gateway->calls == before);
        gateway->available = true;
        gateway->fail = false;
        std::cout << "[PASS] Local fallback" << std::endl;
    }

    // Talk: transcript only on the first exchange, continuation id passed through.
    {
        auto first = reflection.talk(id, "  Where do I start?  ");
        assert(!first.usedFallback);
        assert(gateway->lastTalk->text == "Too much on my plate this week\n\nWhere do I start?");
        assert(!gateway->lastTalk->previousResponseId);
        assert(gateway->lastTalk->capsule && gateway->lastTalk->capsule->mode == domain::capsule::CapsuleMode::Talk);

        std::string continuation = *lifecycle->get(id)->talkLastResponseId;
        reflection.talk(id, "And then?");
        assert(gateway->lastTalk->text == "And then?");
        assert(gateway->lastTalk->previousResponseId == continuation);

        auto t = lifecycle->get(id);
        assert(t->talkMessages.size() == 4);
        assert(t->talkMessages[0].text == "Where do I start?");
        assert(t->talkPromptVersion == std::string("talk-v2"));

        gateway->fail = true;
        auto offline = reflection.talk(id, "Still there?");
        assert(offline.usedFallback);
        assert(lifecycle->get(id)->talkMessages.size() == 4);
        gateway->fail = false;
        std::cout << "[PASS] Talk continuation" << std::endl;
    }

    // Input validation.
    {
        bool threw = false;
        try {
            reflection.talk(id, "   ");
        } catch (const domain::ValidationError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            reflection.runTool("missing-id", ReflectTool::Reflect);
        } catch (const domain::NotFoundError&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Reflection validation" << std::endl;
    }

    // Teaching steps: remote ordering and prompt split, local seed on failure.
    {
        TeachingStepsService teachings(gateway);
        gateway->steps.programmeSlug = "core";
        gateway->steps.steps = {{2, "Second", "Body two", {}, std::nullopt},
                                {1, "First", "Body one\n\nPrompt: What do you notice?", {}, 1}};
        auto remote = teachings.fetch(StepsLane::Focus);
        assert(remote.fromRemote);
        assert(remote.programme == "core");
        assert(remote.teachings.size() == 2);
        assert(remote.teachings[0].title == "First");
        assert(remote.teachings[0].body == "Body one");
        assert(remote.teachings[0].prompt == "What do you notice?");
        assert(remote.teachings[1].prompt.empty());

        gateway->fail = true;
        auto local = teachings.fetch(StepsLane::Reflect, "starter_5day");
        assert(!local.fromRemote);
        assert(local.teachings.size() == TeachingStepsService::LocalSeed().size());
        gateway->fail = false;
        std::cout << "[PASS] Teaching steps" << std::endl;
    }

    // Endpoint resolution.
    {
        auto a = ReasoningGatewayClient::ResolveEndpoint("https://example.org/functions/v1", "reasoning-talk");
        assert(a && a->origin == "https://example.org" && a->path == "/functions/v1/reasoning-talk");

        auto b = ReasoningGatewayClient::ResolveEndpoint("https://example.org/functions/v1/reasoning-reflect/",
                                                         "reasoning-options");
        assert(b && b->path == "/functions/v1/reasoning-options");

        auto c = ReasoningGatewayClient::ResolveEndpoint("http://localhost:8080/focus-steps", "reflect-steps");
        assert(c && c->origin == "http://localhost:8080" && c->path == "/reflect-steps");

        assert(!ReasoningGatewayClient::ResolveEndpoint("ftp://example.org", "reasoning-talk"));
        assert(!ReasoningGatewayClient::ResolveEndpoint("not a url", "reasoning-talk"));

        assert(ReasoningGatewayClient::EndpointFor(ReflectTool::Perspective) == "reasoning-perspective");
        assert(ReasoningGatewayClient::StepsEndpointFor(StepsLane::Practice) == "practice-steps");
        assert(ReasoningGatewayClient::DefaultProgramme(StepsLane::Reflect) == "starter_5day");
        assert(ReasoningGatewayClient::DefaultProgramme(StepsLane::Focus) == "core");

        infrastructure::GatewaySettings unset;
        ReasoningGatewayClient client(unset);
        assert(!client.isAvailable());
        bool threw = false;
        try {
            client.runTool(ReflectTool::Reflect, ReflectRequest{});
        } catch (const GatewayUnavailableError&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Endpoint resolution" << std::endl;
    }

    // Wire format.
    {
        TalkRequest request;
        request.text = "hello";
        request.client = "reflectcore-test";
        request.appVersion = "9.9.9";
        request.previousResponseId = "resp-1";
        domain::capsule::ExportSnapshot snap;
        snap.preferences = {{"output_style", "bullets"}};
        request.capsule = snap;

        auto j = infrastructure::TalkRequestToWireJson(request);
        assert(j["previous_response_id"] == "resp-1");
        assert(j["capsule"]["preferences"]["output_style"] == "bullets");
        assert(!j["capsule"].contains("learnedCues"));
        assert(!j.contains("recordedAt"));

        bool threw = false;
        try {
            infrastructure::TalkResponseFromWireJson(infrastructure::json{{"text", "hi"}});
        } catch (const GatewayDecodeError&) {
            threw = true;
        }
        assert(threw);

        auto parsed = infrastructure::ReflectResponseFromWireJson(
            infrastructure::json{{"text", "ok"}, {"prompt_version", "p1"}});
        assert(parsed.text == "ok" && parsed.promptVersion == "p1");
        std::cout << "[PASS] Wire format" << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Reflection Gateway Test PASSED" << std::endl;
    return 0;
}
