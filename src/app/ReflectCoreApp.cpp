/**
 * @file ReflectCoreApp.cpp
 * @brief Implementation of the ReflectCore command-line application.
 */

#include "app/ReflectCoreApp.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "application/capsule/SnapshotExporter.hpp"
#include "domain/DomainErrors.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/AudioFileStore.hpp"
#include "infrastructure/CapsuleRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PatternStatRepositoryFs.hpp"
#include "infrastructure/ReasoningGatewayClient.hpp"
#include "infrastructure/TurnRepositoryFs.hpp"

namespace reflectcore::app {

using application::capsule::SnapshotExporter;
using domain::Timestamp;
using domain::capsule::CapsuleMode;
using domain::turn::CaptureContext;
using domain::turn::Turn;

namespace {

constexpr std::size_t kAutoTitleLength = 48;

Timestamp Now() {
    return std::chrono::system_clock::now();
}

std::string ReadInput(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw domain::ValidationError("Cannot read " + source);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::optional<std::string> AutoTitleFrom(const std::string& text) {
    std::string firstLine = domain::Trim(text.substr(0, text.find('\n')));
    if (firstLine.empty()) return std::nullopt;
    return domain::TruncateUtf8(firstLine, kAutoTitleLength);
}

std::string JoinFrom(const std::vector<std::string>& args, std::size_t start) {
    std::string out;
    for (std::size_t i = start; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

std::optional<domain::gateway::StepsLane> LaneFromString(const std::string& raw) {
    if (raw == "reflect") return domain::gateway::StepsLane::Reflect;
    if (raw == "focus") return domain::gateway::StepsLane::Focus;
    if (raw == "practice") return domain::gateway::StepsLane::Practice;
    return std::nullopt;
}

void PrintTurnLine(const Turn& t) {
    std::cout << t.id << "  " << domain::ToIso8601(t.recordedAt) << "  "
              << domain::turn::StateToString(t.state) << "  "
              << (t.title.empty() ? domain::turn::kUntitledPlaceholder : t.title) << std::endl;
}

} // namespace

int ReflectCoreApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "help" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    try {
        Init();
        return Dispatch(args);
    } catch (const domain::ValidationError& e) {
        std::cerr << "[ReflectCore] Invalid input: " << e.what() << std::endl;
        return 2;
    } catch (const domain::NotFoundError& e) {
        std::cerr << "[ReflectCore] " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[ReflectCore] Error: " << e.what() << std::endl;
        return 1;
    }
}

void ReflectCoreApp::Init() {
    m_dataRoot = infrastructure::PathUtils::GetAppDataDir();
    m_config = infrastructure::ConfigLoader::Load(m_dataRoot);

    // Dependency Injection / Composition Root
    const std::string root = m_dataRoot.string();
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto turnRepo = std::make_shared<infrastructure::TurnRepositoryFs>(root, persistence);
    auto audioStore = std::make_shared<infrastructure::AudioFileStore>(
        infrastructure::PathUtils::GetAudioDir(m_dataRoot).string());
    auto statRepo = std::make_shared<infrastructure::PatternStatRepositoryFs>(root, persistence);
    auto capsuleRepo = std::make_shared<infrastructure::CapsuleRepositoryFs>(root, persistence);
    auto gateway = std::make_shared<infrastructure::ReasoningGatewayClient>(m_config.gateway);

    m_services.persistenceService = persistence;
    m_services.turnLifecycle = std::make_shared<application::TurnLifecycleService>(turnRepo, audioStore);
    m_services.patternLearning = std::make_shared<application::learning::PatternLearningService>(
        statRepo, m_config.defaultHalfLifeDays);
    m_services.capsuleService = std::make_shared<application::capsule::CapsuleService>(
        capsuleRepo, m_services.patternLearning);
    m_services.reflectionService = std::make_shared<application::ReflectionService>(
        m_services.turnLifecycle, m_services.capsuleService, gateway, m_config.client, m_config.appVersion);
    m_services.teachingSteps = std::make_unique<application::TeachingStepsService>(gateway);
    m_services.dictionaryStore = std::make_shared<infrastructure::RedactionDictionaryStore>(root, persistence);

    // Loads the capsule so the learning gate reaches the pattern store before any observation.
    m_services.capsuleService->get();

    m_services.turnLifecycle->setCompletionHandler([this](const Turn& turn) { OnTurnCompleted(turn); });
}

void ReflectCoreApp::OnTurnCompleted(const Turn& turn) {
    Timestamp ts = Now();
    auto observations = m_services.patternLearning->learnFromText(turn.transcriptRedactedActive, ts);
    m_services.turnLifecycle->setLearningSnapshot(
        turn.id, application::learning::PatternLearner::ToSnapshotJson(observations));
    m_services.capsuleService->syncLearnedTendencies(ts);
}

int ReflectCoreApp::Dispatch(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    if (cmd == "import") return CmdImport(args);
    if (cmd == "transcript") return CmdTranscript(args);
    if (cmd == "list") return CmdList();
    if (cmd == "show") return CmdShow(args);
    if (cmd == "rename") return CmdRename(args);
    if (cmd == "delete") return CmdDelete(args);
    if (cmd == "redact") return CmdRedact(args);
    if (cmd == "reflect") return CmdReflect(args);
    if (cmd == "talk") return CmdTalk(args);
    if (cmd == "steps") return CmdSteps(args);
    if (cmd == "capsule") return CmdCapsule(args);
    if (cmd == "patterns") return CmdPatterns(args);
    if (cmd == "dict") return CmdDictionary(args);

    std::cerr << "[ReflectCore] Unknown command: " << cmd << std::endl;
    PrintUsage();
    return 1;
}

void ReflectCoreApp::PrintUsage() const {
    std::cout <<
        "Usage: reflectcore <command> [args]\n"
        "  import <file|->                    create a turn from already-redacted text\n"
        "  transcript <file|-> [--keep-raw]   run raw text through redaction into a new turn\n"
        "  list                               list turns, newest first\n"
        "  show <id>                          show one turn\n"
        "  rename <id> <title>\n"
        "  delete <id>\n"
        "  redact <id>                        re-apply the current dictionary to a stored raw transcript\n"
        "  reflect <id> [reflect|options|questions|perspective]\n"
        "  talk <id> <message>\n"
        "  steps [reflect|focus|practice] [programme]\n"
        "  capsule show|export [talk]|set <key> <value>|unset <key>\n"
        "  capsule learning on|off|reset-learning|reset\n"
        "  patterns [limit]\n"
        "  dict list|add <token>|remove <token>\n";
}

int ReflectCoreApp::CmdImport(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    std::string text = ReadInput(args[1]);
    std::string id = m_services.turnLifecycle->createTextImport(text, Now(), CaptureContext::Unknown);
    std::cout << id << std::endl;
    return 0;
}

int ReflectCoreApp::CmdTranscript(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    bool keepRaw = args.size() > 2 && args[2] == "--keep-raw";
    std::string raw = ReadInput(args[1]);
    if (domain::IsBlank(raw)) {
        throw domain::ValidationError("Transcript is empty");
    }

    auto& lifecycle = *m_services.turnLifecycle;
    Timestamp started = Now();
    std::string id = lifecycle.createCapture(std::nullopt, started, CaptureContext::Unknown);
    lifecycle.beginRecording(id);
    lifecycle.markCaptured(id, started, 0);
    lifecycle.beginTranscribing(id, domain::turn::TranscriptionProvider::Unknown, std::nullopt);
    lifecycle.markTranscribedRaw(id);
    lifecycle.beginRedacting(id);

    auto outcome = lifecycle.applyRedaction(id, raw, m_services.dictionaryStore->load(), keepRaw);
    lifecycle.markReady(id, Now(),
                        keepRaw ? std::optional<std::string>(raw) : std::nullopt,
                        outcome.redactedText, outcome.redactionVersion, outcome.redactionTimestamp,
                        AutoTitleFrom(outcome.redactedText));
    std::cout << id << std::endl;
    return 0;
}

int ReflectCoreApp::CmdList() {
    for (const auto& t : m_services.turnLifecycle->listNewestFirst()) {
        PrintTurnLine(t);
    }
    return 0;
}

int ReflectCoreApp::CmdShow(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    auto turn = m_services.turnLifecycle->get(args[1]);
    if (!turn) {
        throw domain::NotFoundError("Turn not found: " + args[1]);
    }
    PrintTurnLine(*turn);
    std::cout << "redaction v" << turn->redactionVersion
              << (turn->transcriptRaw ? " (raw stored)" : "") << "\n\n"
              << turn->transcriptRedactedActive << std::endl;
    if (turn->error) {
        std::cout << "\nerror: " << turn->error->domain << "/" << turn->error->code << " "
                  << turn->error->debugMessage.value_or("") << std::endl;
    }
    for (const auto& [tool, output] : turn->toolOutputs) {
        std::cout << "\n--- " << domain::turn::ToolToString(tool) << " (" << output.promptVersion << ")\n"
                  << output.text << std::endl;
    }
    for (const auto& m : turn->talkMessages) {
        std::cout << "\n[" << m.role << "] " << m.text << std::endl;
    }
    return 0;
}

int ReflectCoreApp::CmdRename(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        PrintUsage();
        return 1;
    }
    m_services.turnLifecycle->setTitle(args[1], JoinFrom(args, 2));
    return 0;
}

int ReflectCoreApp::CmdDelete(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    m_services.turnLifecycle->deleteTurn(args[1]);
    return 0;
}

int ReflectCoreApp::CmdRedact(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    auto outcome = m_services.turnLifecycle->reapplyRedaction(args[1], m_services.dictionaryStore->load());
    std::cout << (outcome.applied ? "Redaction updated to v" : "Unchanged at v")
              << outcome.redactionVersion << std::endl;
    return 0;
}

int ReflectCoreApp::CmdReflect(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    auto tool = domain::turn::ReflectTool::Reflect;
    if (args.size() > 2) {
        auto parsed = domain::turn::ToolFromString(args[2]);
        if (!parsed) {
            throw domain::ValidationError("Unknown tool: " + args[2]);
        }
        tool = *parsed;
    }
    auto result = m_services.reflectionService->runTool(args[1], tool);
    std::cout << result.text << std::endl;
    return 0;
}

int ReflectCoreApp::CmdTalk(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        PrintUsage();
        return 1;
    }
    auto result = m_services.reflectionService->talk(args[1], JoinFrom(args, 2));
    std::cout << result.text << std::endl;
    return 0;
}

int ReflectCoreApp::CmdSteps(const std::vector<std::string>& args) {
    auto lane = domain::gateway::StepsLane::Reflect;
    if (args.size() > 1) {
        auto parsed = LaneFromString(args[1]);
        if (!parsed) {
            throw domain::ValidationError("Unknown lane: " + args[1]);
        }
        lane = *parsed;
    }
    std::string programme = args.size() > 2 ? args[2] : "";
    auto list = m_services.teachingSteps->fetch(lane, programme);
    for (const auto& t : list.teachings) {
        std::cout << (t.stepIndex + 1) << ". " << t.title << "\n" << t.body << "\n";
        if (!t.prompt.empty()) std::cout << "   > " << t.prompt << "\n";
        std::cout << std::endl;
    }
    return 0;
}

int ReflectCoreApp::CmdCapsule(const std::vector<std::string>& args) {
    auto& capsule = *m_services.capsuleService;
    std::string sub = args.size() > 1 ? args[1] : "show";

    if (sub == "show") {
        auto c = capsule.get();
        std::cout << "version " << c.version << ", learning " << (c.learningEnabled ? "on" : "off") << "\n";
        for (const auto& [k, v] : capsule.preferenceKeyValues()) {
            std::cout << "  " << k << " = " << v << "\n";
        }
        for (const auto& t : c.learnedTendencies) {
            std::cout << "  * " << t.statement << " (" << t.evidenceCount << ")\n";
        }
        std::cout << std::flush;
        return 0;
    }
    if (sub == "export") {
        CapsuleMode mode = args.size() > 2 && args[2] == "talk" ? CapsuleMode::Talk : CapsuleMode::Reflect;
        auto snapshot = SnapshotExporter::project(capsule.get(), mode);
        std::cout << infrastructure::SnapshotToWireJson(snapshot).dump(2) << std::endl;
        return 0;
    }
    if (sub == "set" && args.size() > 3) {
        if (!capsule.setPreference(args[2], JoinFrom(args, 3))) {
            throw domain::ValidationError("Preference rejected: " + args[2]);
        }
        return 0;
    }
    if (sub == "unset" && args.size() > 2) {
        if (!capsule.removePreference(args[2])) {
            std::cout << "No such preference: " << args[2] << std::endl;
        }
        return 0;
    }
    if (sub == "learning" && args.size() > 2) {
        const std::string& action = args[2];
        if (action == "on" || action == "off") {
            capsule.setLearningEnabled(action == "on");
        } else if (action == "reset-learning") {
            capsule.resetLearnedProfile();
        } else if (action == "reset") {
            capsule.resetToDefaults();
        } else {
            throw domain::ValidationError("Unknown learning action: " + action);
        }
        return 0;
    }

    PrintUsage();
    return 1;
}

int ReflectCoreApp::CmdPatterns(const std::vector<std::string>& args) {
    std::size_t limit = 20;
    if (args.size() > 1) {
        try {
            limit = static_cast<std::size_t>(std::stoul(args[1]));
        } catch (const std::exception&) {
            throw domain::ValidationError("Invalid limit: " + args[1]);
        }
    }
    for (const auto& r : m_services.patternLearning->topPatterns(std::nullopt, limit, Now())) {
        std::cout << domain::learning::KindToString(r.stat.kind) << "  " << r.stat.key
                  << "  score=" << r.currentScore << "  count=" << r.stat.count << std::endl;
    }
    return 0;
}

int ReflectCoreApp::CmdDictionary(const std::vector<std::string>& args) {
    auto& store = *m_services.dictionaryStore;
    std::string sub = args.size() > 1 ? args[1] : "list";

    domain::redaction::RedactionDictionary dict;
    if (sub == "list") {
        dict = store.load();
    } else if (sub == "add" && args.size() > 2) {
        dict = store.addToken(JoinFrom(args, 2));
    } else if (sub == "remove" && args.size() > 2) {
        dict = store.removeToken(JoinFrom(args, 2));
    } else {
        PrintUsage();
        return 1;
    }

    std::cout << "dictionary v" << dict.version << std::endl;
    for (const auto& token : dict.tokens) {
        std::cout << "  " << token << std::endl;
    }
    return 0;
}

} // namespace reflectcore::app
