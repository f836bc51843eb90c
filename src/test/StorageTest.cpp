#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/CapsuleRepositoryFs.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PatternStatRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RedactionDictionaryStore.hpp"
#include "infrastructure/TurnRepositoryFs.hpp"

using namespace reflectcore;
using namespace reflectcore::domain::turn;
using reflectcore::infrastructure::json;

namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Storage Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "reflectcore_test_storage";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    const auto t0 = domain::FromEpochMillis(1700000000123LL);

    // Turn records keep optional fields and tool outputs.
    {
        infrastructure::TurnRepositoryFs repo(testRoot.string(), persistence);

        Turn t;
        t.id = "turn-a";
        t.recordedAt = t0;
        t.endedAt = t0 + std::chrono::seconds(42);
        t.durationSeconds = 42.0;
        t.captureContext = CaptureContext::Car;
        t.title = "Drive home";
        t.transcriptRedactedActive = "Call [CUSTOM] tomorrow";
        t.toolOutputs[ReflectTool::Perspective] = ToolOutput{"Zoom out", "p-1", t0};
        t.talkMessages.push_back({"user", "hi", t0});
        t.talkLastResponseId = "resp-9";
        t.redactionVersion = 3;
        t.state = TurnState::Failed;
        t.error = TurnError{"capture", 7, std::string("mic_denied"), std::nullopt};
        repo.save(t);

        auto loaded = repo.findById("turn-a");
        assert(loaded);
        assert(loaded->recordedAt == t0);
        assert(loaded->endedAt == t.endedAt);
        assert(loaded->captureContext == CaptureContext::Car);
        assert(!loaded->transcriptRaw.has_value());
        assert(loaded->toolOutputs.at(ReflectTool::Perspective).text == "Zoom out");
        assert(loaded->talkMessages.size() == 1 && loaded->talkMessages[0].role == "user");
        assert(loaded->talkLastResponseId == std::string("resp-9"));
        assert(loaded->redactionVersion == 3);
        assert(loaded->state == TurnState::Failed);
        assert(loaded->error && loaded->error->code == 7);
        assert(loaded->error->userFacingKey == std::string("mic_denied"));
        std::cout << "[PASS] Turn record" << std::endl;
    }

    // Unknown states load as interrupted; unreadable records are skipped.
    {
        infrastructure::TurnRepositoryFs repo(testRoot.string(), persistence);
        WriteFile(testRoot / "turns" / "turn-b.json",
                  R"({"id": "turn-b", "state": "archived", "transcriptRedactedActive": "x"})");
        WriteFile(testRoot / "turns" / "turn-c.json", "{ not json");
        WriteFile(testRoot / "turns" / "turn-d.json", R"({"title": "no id"})");

        auto b = repo.findById("turn-b");
        assert(b && b->state == TurnState::Interrupted);
        assert(!repo.findById("turn-c"));
        assert(!repo.findById("turn-d"));
        assert(!repo.findById("missing"));
        assert(repo.findAll().size() == 2);

        assert(repo.remove("turn-b"));
        assert(!repo.remove("turn-b"));
        std::cout << "[PASS] Tolerant turn loading" << std::endl;
    }

    // Redaction provenance is appended line by line.
    {
        infrastructure::TurnRepositoryFs repo(testRoot.string(), persistence);
        repo.appendRedaction({"r1", "turn-a", 1, t0, "hash1", "first"});
        persistence->appendText((testRoot / "redactions" / "turn-a.ndjson").string(), "garbage\n");
        repo.appendRedaction({"r2", "turn-a", 2, t0, "hash2", "second"});

        auto log = repo.redactionsFor("turn-a");
        assert(log.size() == 2);
        assert(log[0].id == "r1" && log[1].version == 2);
        assert(log[1].timestamp == t0);

        repo.removeRedactions("turn-a");
        assert(repo.redactionsFor("turn-a").empty());
        std::cout << "[PASS] Redaction log" << std::endl;
    }

    // Pattern rows with an unknown kind are dropped on load.
    {
        WriteFile(testRoot / "learning" / "pattern_stats.json", json{
            {"stats", json::array({
                {{"kind", "style_preference"}, {"key", "bullets"}, {"score", 1.5}, {"count", 3},
                 {"firstSeenAt_ms", 1700000000000LL}, {"lastSeenAt_ms", 1700000000000LL}, {"halfLifeDays", 90.0}},
                {{"kind", "mood"}, {"key", "calm"}, {"score", 1.0}, {"count", 1}}
            })}
        }.dump());

        infrastructure::PatternStatRepositoryFs repo(testRoot.string(), persistence);
        auto rows = repo.findAll();
        assert(rows.size() == 1);
        assert(rows[0].key == "bullets");
        assert(rows[0].halfLifeDays == 90.0);
        assert(repo.find(domain::learning::PatternKind::StylePreference, "bullets")->count == 3);
        std::cout << "[PASS] Pattern rows" << std::endl;
    }

    // Capsule keeps absent preferences absent.
    {
        infrastructure::CapsuleRepositoryFs repo(testRoot.string(), persistence);
        assert(!repo.load());

        auto c = domain::capsule::Capsule::Empty(t0);
        c.version = 5;
        c.preferences.noPersona = false;
        c.preferences.extras["tone"] = "warm";
        c.preferences.lists[domain::capsule::ListPreference::Terms] = {"impermanence", "non-self"};
        c.learningResetAt = t0;
        domain::capsule::CapsuleTendency tendency;
        tendency.statement = "Prefers bullet points";
        tendency.evidenceCount = 4;
        tendency.firstSeenAt = t0;
        tendency.lastSeenAt = t0;
        tendency.sourceKind = "style_preference";
        c.learnedTendencies.push_back(tendency);
        repo.save(c);

        auto loaded = repo.load();
        assert(loaded);
        assert(loaded->version == 5);
        assert(loaded->updatedAt == t0);
        assert(loaded->preferences.noPersona == false);
        assert(!loaded->preferences.outputStyle.has_value());
        assert(!loaded->preferences.optionsBeforeQuestions.has_value());
        assert(loaded->preferences.extras.at("tone") == "warm");
        assert(loaded->preferences.lists.size() == 1);
        assert((loaded->preferences.lists.at(domain::capsule::ListPreference::Terms) ==
                std::vector<std::string>{"impermanence", "non-self"}));
        assert(loaded->learningResetAt == t0);
        assert(loaded->learnedTendencies.size() == 1);
        assert(!loaded->learnedTendencies[0].sourceKey.has_value());
        std::cout << "[PASS] Capsule record" << std::endl;
    }

    // Dictionary edits bump the version only when the token set changes.
    {
        infrastructure::RedactionDictionaryStore store(testRoot.string(), persistence);
        assert(store.load().version == 1 && store.load().tokens.empty());

        auto d = store.addToken("  Acme ");
        assert(d.version == 2 && d.tokens.size() == 1 && d.tokens[0] == "Acme");
        assert(store.addToken("ACME").version == 2);
        assert(store.addToken("   ").version == 2);
        assert(store.addToken("Bob").version == 3);
        assert(store.removeToken("acme").version == 4);
        assert(store.removeToken("acme").version == 4);

        infrastructure::RedactionDictionaryStore reopened(testRoot.string(), persistence);
        auto loaded = reopened.load();
        assert(loaded.version == 4);
        assert(loaded.tokens.size() == 1 && loaded.tokens[0] == "Bob");
        std::cout << "[PASS] Redaction dictionary" << std::endl;
    }

    // Settings: defaults, saved values, foreign keys kept, environment wins.
    {
        fs::path configRoot = testRoot / "config";
        fs::create_directories(configRoot);
        unsetenv("REFLECTCORE_GATEWAY_URL");
        unsetenv("REFLECTCORE_GATEWAY_KEY");

        auto defaults = infrastructure::ConfigLoader::Load(configRoot);
        assert(!defaults.gateway.isConfigured());
        assert(defaults.client == "reflectcore-cli");

        WriteFile(configRoot / "settings.json",
                  R"({"theme": "dark", "learning": {"default_half_life_days": 0.5}})");
        auto config = infrastructure::ConfigLoader::Load(configRoot);
        assert(config.defaultHalfLifeDays == domain::learning::kDefaultHalfLifeDays);

        config.gateway.baseUrl = "https://example.org/functions/v1";
        config.gateway.anonKey = "anon";
        config.defaultHalfLifeDays = 21.0;
        infrastructure::ConfigLoader::Save(configRoot, config);

        auto reloaded = infrastructure::ConfigLoader::Load(configRoot);
        assert(reloaded.gateway.isConfigured());
        assert(reloaded.defaultHalfLifeDays == 21.0);

        std::ifstream in(configRoot / "settings.json");
        json saved = json::parse(in);
        assert(saved["theme"] == "dark");

        setenv("REFLECTCORE_GATEWAY_URL", "http://localhost:9000", 1);
        assert(infrastructure::ConfigLoader::Load(configRoot).gateway.baseUrl == "http://localhost:9000");
        unsetenv("REFLECTCORE_GATEWAY_URL");
        std::cout << "[PASS] Settings" << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Storage Test PASSED" << std::endl;
    return 0;
}
