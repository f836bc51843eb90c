#undef NDEBUG
#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "application/TurnLifecycleService.hpp"
#include "application/learning/PatternLearningService.hpp"
#include "infrastructure/AudioFileStore.hpp"
#include "infrastructure/PatternStatRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TurnRepositoryFs.hpp"

using namespace reflectcore;
using reflectcore::application::TurnLifecycleService;
using reflectcore::application::learning::PatternLearningService;
using reflectcore::domain::learning::PatternKind;
using reflectcore::domain::turn::CaptureContext;

namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "reflectcore_test_concurrency";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot / "audio");

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto turnRepo = std::make_shared<infrastructure::TurnRepositoryFs>(testRoot.string(), persistence);
    auto audio = std::make_shared<infrastructure::AudioFileStore>((testRoot / "audio").string());
    TurnLifecycleService lifecycle(turnRepo, audio);

    const int NUM_THREADS = 24;
    auto now = std::chrono::system_clock::now();

    // Concurrent edits of one Turn must not lose updates.
    {
        std::string id = lifecycle.createTextImport("Shared turn", now, CaptureContext::Unknown);

        std::vector<std::thread> threads;
        std::atomic<int> failures{0};
        std::cout << "[Test] Spawning " << NUM_THREADS << " threads recording talk exchanges..." << std::endl;
        for (int i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&lifecycle, &id, &failures, i]() {
                try {
                    lifecycle.recordTalkExchange(id, "Message " + std::to_string(i), "Reply " + std::to_string(i),
                                                 std::string("resp-") + std::to_string(i), "v1", std::nullopt);
                } catch (const std::exception& e) {
                    std::cerr << "[Test] Exchange failed: " << e.what() << std::endl;
                    failures++;
                }
            });
        }
        for (auto& t : threads) t.join();

        assert(failures == 0);
        auto turn = lifecycle.get(id);
        assert(turn);
        std::cout << "[Test] Talk messages: " << turn->talkMessages.size() << std::endl;
        assert(turn->talkMessages.size() == static_cast<std::size_t>(NUM_THREADS * 2));

        // User and assistant entries stay paired.
        std::set<std::string> users;
        for (std::size_t i = 0; i + 1 < turn->talkMessages.size(); i += 2) {
            assert(turn->talkMessages[i].role == "user");
            assert(turn->talkMessages[i + 1].role == "assistant");
            users.insert(turn->talkMessages[i].text);
        }
        assert(users.size() == static_cast<std::size_t>(NUM_THREADS));
        std::cout << "[PASS] Per-turn serialization" << std::endl;
    }

    // Out-of-order markReady callbacks keep the highest redaction version.
    {
        std::string id = lifecycle.createCapture(std::nullopt, now, CaptureContext::Handsfree);
        std::vector<std::thread> threads;
        for (int i = 1; i <= NUM_THREADS; ++i) {
            threads.emplace_back([&lifecycle, &id, now, i]() {
                lifecycle.markReady(id, now + std::chrono::seconds(i), std::nullopt,
                                    "Version " + std::to_string(i), i, now, std::string("Auto title"));
            });
        }
        for (auto& t : threads) t.join();

        auto turn = lifecycle.get(id);
        assert(turn);
        assert(turn->state == domain::turn::TurnState::Ready);
        assert(turn->redactionVersion == NUM_THREADS);
        assert(turn->title == "Auto title");
        assert(!turn->error.has_value());
        std::cout << "[PASS] Concurrent completion" << std::endl;
    }

    // Different Turns proceed independently.
    {
        auto before = lifecycle.listNewestFirst().size();
        std::vector<std::thread> threads;
        std::vector<std::string> ids(NUM_THREADS);
        for (int i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&lifecycle, &ids, now, i]() {
                ids[i] = lifecycle.createTextImport("Turn " + std::to_string(i), now, CaptureContext::Unknown);
                lifecycle.setTitle(ids[i], "Title " + std::to_string(i));
            });
        }
        for (auto& t : threads) t.join();

        assert(lifecycle.listNewestFirst().size() == before + NUM_THREADS);
        for (int i = 0; i < NUM_THREADS; ++i) {
            auto t = lifecycle.get(ids[i]);
            assert(t && t->title == "Title " + std::to_string(i));
        }
        std::cout << "[PASS] Independent turns" << std::endl;
    }

    // Concurrent observations of one key are all counted.
    {
        auto statRepo = std::make_shared<infrastructure::PatternStatRepositoryFs>(testRoot.string(), persistence);
        PatternLearningService patterns(statRepo);

        std::vector<std::thread> threads;
        for (int i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&patterns, now]() {
                patterns.observe(PatternKind::ConstraintTrigger, "trigger:noise", 0.1, now);
                patterns.observe(PatternKind::StylePreference, "bullets", 0.1, now);
            });
        }
        for (auto& t : threads) t.join();

        auto rows = patterns.rankedPatterns(now);
        assert(rows.size() == 2);
        for (const auto& r : rows) {
            assert(r.stat.count == NUM_THREADS);
            assert(r.currentScore > NUM_THREADS * 0.1 - 1e-6);
        }
        std::cout << "[PASS] Observation counting" << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
