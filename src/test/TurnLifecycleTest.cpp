#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "application/TurnLifecycleService.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/AudioFileStore.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TurnRepositoryFs.hpp"

using namespace reflectcore;
using namespace reflectcore::domain::turn;
using reflectcore::application::TurnLifecycleService;

namespace fs = std::filesystem;

namespace {

class FailingAudioStore : public AudioStore {
public:
    bool removeAudio(const std::string&) override {
        throw domain::StorageError("disk unavailable");
    }
};

void CheckFailureInvariant(const Turn& t) {
    assert((t.state == TurnState::Failed) == t.error.has_value());
}

Turn Load(TurnLifecycleService& service, const std::string& id) {
    auto t = service.get(id);
    assert(t && "Turn should exist.");
    CheckFailureInvariant(*t);
    return *t;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Turn Lifecycle Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "reflectcore_test_lifecycle";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot / "audio");

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_shared<infrastructure::TurnRepositoryFs>(testRoot.string(), persistence);
    auto audio = std::make_shared<infrastructure::AudioFileStore>((testRoot / "audio").string());
    TurnLifecycleService service(repo, audio);

    int completions = 0;
    service.setCompletionHandler([&completions](const Turn&) { ++completions; });

    auto now = std::chrono::system_clock::now();

    // Text import goes straight to ready, no raw transcript.
    {
        std::string id = service.createTextImport("I feel stuck at work", now, CaptureContext::Unknown);
        Turn t = Load(service, id);
        assert(t.state == TurnState::Ready);
        assert(t.transcriptRedactedActive == "I feel stuck at work");
        assert(!t.transcriptRaw.has_value());
        assert(t.source == TurnSource::ImportedText);
        assert(t.learningSnapshotJson == "{}");
        assert(completions == 1);
        std::cout << "[PASS] Text import" << std::endl;
    }

    // Whitespace-only import is rejected and persists nothing.
    {
        auto before = service.listNewestFirst().size();
        bool threw = false;
        try {
            service.createTextImport("   \n  ", now, CaptureContext::Unknown);
        } catch (const domain::ValidationError&) {
            threw = true;
        }
        assert(threw);
        assert(service.listNewestFirst().size() == before);
        std::cout << "[PASS] Blank import rejected" << std::endl;
    }

    // markFailed keeps transcripts already captured.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Handheld);
        assert(Load(service, id).state == TurnState::Queued);
        service.beginRecording(id);
        service.markCaptured(id, now + std::chrono::seconds(5), 0);
        service.beginTranscribing(id, TranscriptionProvider::OnDevice, std::string("en-GB"));
        service.markTranscribedRaw(id);
        service.beginRedacting(id);
        domain::redaction::RedactionDictionary dict;
        service.applyRedaction(id, "hello there", dict, true);
        Load(service, id);

        service.markFailed(id, "mic error");
        Turn t = Load(service, id);
        assert(t.state == TurnState::Failed);
        assert(t.error && t.error->debugMessage == std::string("mic error"));
        assert(t.transcriptRedactedActive == "hello there");
        assert(t.transcriptRaw == std::string("hello there"));

        // Permissive: failed -> ready is accepted and clears the error.
        service.markReady(id, now + std::chrono::seconds(6), std::nullopt, "hello there", 1, now, std::nullopt);
        t = Load(service, id);
        assert(t.state == TurnState::Ready);
        assert(!t.error.has_value());
        std::cout << "[PASS] Failure keeps transcripts; ready after failure is accepted" << std::endl;
    }

    // Redaction version never decreases.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Unknown);
        service.markReady(id, now, std::nullopt, "a", 3, now, std::nullopt);
        assert(Load(service, id).redactionVersion == 3);
        service.markReady(id, now, std::nullopt, "a", 2, now, std::nullopt);
        assert(Load(service, id).redactionVersion == 3);
        service.markReady(id, now, std::nullopt, "a", 5, now, std::nullopt);
        assert(Load(service, id).redactionVersion == 5);
        std::cout << "[PASS] Monotonic redaction version" << std::endl;
    }

    // Title auto-fill never overwrites a user title.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Unknown);
        service.setTitle(id, "My Session");
        service.markReady(id, now, std::nullopt, "text", 1, now, std::string("Auto Title"));
        assert(Load(service, id).title == "My Session");

        std::string untitled = service.createCapture(std::nullopt, now, CaptureContext::Unknown);
        service.setTitle(untitled, "untitled");
        service.markReady(untitled, now, std::nullopt, "text", 1, now, std::string("Auto Title"));
        assert(Load(service, untitled).title == "Auto Title");
        service.markReady(untitled, now, std::nullopt, "text", 1, now, std::string("Second Title"));
        assert(Load(service, untitled).title == "Auto Title");
        std::cout << "[PASS] Title auto-fill gate" << std::endl;
    }

    // Duration is clamped at zero.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Unknown);
        service.markReady(id, now - std::chrono::seconds(30), std::nullopt, "x", 1, now, std::nullopt);
        Turn t = Load(service, id);
        assert(t.durationSeconds && *t.durationSeconds == 0.0);
        std::cout << "[PASS] Duration clamp" << std::endl;
    }

    // Audio bytes require an audio path.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Unknown);
        bool threw = false;
        try {
            service.markCaptured(id, now, 2048);
        } catch (const domain::ValidationError&) {
            threw = true;
        }
        assert(threw);
        assert(Load(service, id).state == TurnState::Queued);
        std::cout << "[PASS] Audio path invariant" << std::endl;
    }

    // Redaction is skipped when nothing changed, re-run when the dictionary moves on.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Unknown);
        domain::redaction::RedactionDictionary dict;
        dict.version = 1;
        dict.tokens = {"Acme"};

        auto first = service.applyRedaction(id, "Meeting at Acme with Bob", dict, true);
        assert(first.applied);
        assert(first.redactedText == "Meeting at [CUSTOM] with Bob");

        auto second = service.applyRedaction(id, "Meeting at Acme with Bob", dict, true);
        assert(!second.applied);
        assert(service.redactionHistory(id).size() == 1);

        dict.version = 2;
        dict.tokens.push_back("Bob");
        auto third = service.reapplyRedaction(id, dict);
        assert(third.applied);
        assert(third.redactedText == "Meeting at [CUSTOM] with [CUSTOM]");
        assert(third.redactionVersion == 2);
        assert(service.redactionHistory(id).size() == 2);
        assert(Load(service, id).transcriptRedactedActive == third.redactedText);
        std::cout << "[PASS] Redaction skip and re-apply" << std::endl;
    }

    // Unknown ids are reported, not created.
    {
        bool threw = false;
        try {
            service.markReady("does-not-exist", now, std::nullopt, "x", 1, now, std::nullopt);
        } catch (const domain::NotFoundError&) {
            threw = true;
        }
        assert(threw);
        assert(!service.get("does-not-exist").has_value());
        std::cout << "[PASS] Not-found" << std::endl;
    }

    // Interrupted and partial completion.
    {
        std::string id = service.createCapture(std::nullopt, now, CaptureContext::Intent);
        service.beginRecording(id);
        service.markInterrupted(id);
        assert(Load(service, id).state == TurnState::Interrupted);

        int before = completions;
        service.markReadyPartial(id, "Half a thought");
        Turn t = Load(service, id);
        assert(t.state == TurnState::ReadyPartial);
        assert(t.transcriptRedactedActive == "Half a thought");
        assert(completions == before + 1);

        service.setLearningSnapshot(id, R"({"observations":[]})");
        assert(Load(service, id).learningSnapshotJson == R"({"observations":[]})");
        service.setLearningSnapshot(id, "");
        t = Load(service, id);
        assert(t.learningSnapshotJson == "{}");
        assert(t.learningSnapshotUpdatedAt.has_value());
        std::cout << "[PASS] Partial completion" << std::endl;
    }

    // Delete removes the audio file, tolerates a missing one, and survives a failing store.
    {
        fs::path audioFile = testRoot / "audio" / "clip.m4a";
        std::ofstream(audioFile) << "audio";
        std::string withAudio = service.createCapture(std::string("clip.m4a"), now, CaptureContext::Handheld);
        service.markCaptured(withAudio, now, 5);
        service.deleteTurn(withAudio);
        assert(!fs::exists(audioFile));
        assert(!service.get(withAudio).has_value());

        std::string missing = service.createCapture(std::string("gone.m4a"), now, CaptureContext::Handheld);
        service.deleteTurn(missing);
        assert(!service.get(missing).has_value());

        TurnLifecycleService failing(repo, std::make_shared<FailingAudioStore>());
        std::string id = failing.createCapture(std::string("clip2.m4a"), now, CaptureContext::Handheld);
        failing.deleteTurn(id);
        assert(!failing.get(id).has_value());
        std::cout << "[PASS] Best-effort audio delete" << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Turn Lifecycle Test PASSED" << std::endl;
    return 0;
}
