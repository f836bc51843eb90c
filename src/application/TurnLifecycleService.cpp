/**
 * @file TurnLifecycleService.cpp
 * @brief Implementation of TurnLifecycleService.
 */

#include "application/TurnLifecycleService.hpp"
#include "domain/DomainErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <random>

namespace reflectcore::application {

using namespace reflectcore::domain;
using namespace reflectcore::domain::turn;

namespace {

// RFC 4122 version 4 layout.
std::string generateUUID() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(engine);
    std::uint64_t lo = dist(engine);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

bool isUnsetTitle(const std::string& title) {
    std::string t = trim(title);
    if (t.empty()) return true;
    std::string placeholder = kUntitledPlaceholder;
    return t.size() == placeholder.size() &&
           std::equal(t.begin(), t.end(), placeholder.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

// Keeps error set iff state == Failed.
void transition(Turn& turn, TurnState next) {
    turn.state = next;
    if (next != TurnState::Failed) {
        turn.error.reset();
    }
}

double durationSeconds(Timestamp from, Timestamp to) {
    std::chrono::duration<double> d = to - from;
    return std::max(0.0, d.count());
}

} // namespace

TurnLifecycleService::TurnLifecycleService(std::shared_ptr<TurnRepository> repository,
                                           std::shared_ptr<AudioStore> audioStore,
                                           Clock clock)
    : m_repository(std::move(repository)),
      m_audioStore(std::move(audioStore)),
      m_clock(std::move(clock)) {}

Timestamp TurnLifecycleService::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

template <typename Fn>
Turn TurnLifecycleService::mutate(const std::string& id, Fn&& fn) {
    auto guard = m_locks.lock(id);
    auto turnOpt = m_repository->findById(id);
    if (!turnOpt) {
        throw NotFoundError("Turn not found: " + id);
    }
    Turn turn = std::move(*turnOpt);
    fn(turn);
    m_repository->save(turn);
    return turn;
}

std::string TurnLifecycleService::createCapture(const std::optional<std::string>& audioPath,
                                                Timestamp recordedAt,
                                                CaptureContext context) {
    Turn turn;
    turn.id = generateUUID();
    turn.source = TurnSource::Captured;
    turn.recordedAt = recordedAt;
    turn.captureContext = context;
    turn.audioPath = audioPath;
    turn.state = TurnState::Queued;

    m_repository->save(turn);
    std::cout << "[TurnLifecycle] Created capture " << turn.id << std::endl;
    return turn.id;
}

std::string TurnLifecycleService::createTextImport(const std::string& redactedText,
                                                   Timestamp recordedAt,
                                                   CaptureContext context) {
    if (trim(redactedText).empty()) {
        throw ValidationError("Imported text is empty");
    }

    Timestamp ts = now();
    Turn turn;
    turn.id = generateUUID();
    turn.source = TurnSource::ImportedText;
    turn.recordedAt = recordedAt;
    turn.captureContext = context;
    turn.transcriptRedactedActive = redactedText;
    turn.learningSnapshotJson = kEmptyLearningSnapshot;
    turn.learningSnapshotVersion = 1;
    turn.learningSnapshotUpdatedAt = ts;
    turn.processingStartedAt = ts;
    turn.processingFinishedAt = ts;
    turn.state = TurnState::Ready;

    m_repository->save(turn);
    std::cout << "[TurnLifecycle] Imported text turn " << turn.id << std::endl;
    notifyCompleted(turn);
    return turn.id;
}

void TurnLifecycleService::beginRecording(const std::string& id) {
    mutate(id, [&](Turn& t) {
        transition(t, TurnState::Recording);
    });
}

void TurnLifecycleService::markCaptured(const std::string& id,
                                        std::optional<Timestamp> endedAt,
                                        std::int64_t audioBytes,
                                        const std::optional<std::string>& audioPath) {
    mutate(id, [&](Turn& t) {
        if (audioPath) t.audioPath = audioPath;
        if (audioBytes > 0 && (!t.audioPath || t.audioPath->empty())) {
            throw ValidationError("Audio bytes recorded without an audio path for turn " + id);
        }
        t.audioBytes = std::max<std::int64_t>(0, audioBytes);
        if (endedAt) {
            t.endedAt = endedAt;
            t.durationSeconds = durationSeconds(t.recordedAt, *endedAt);
        }
        transition(t, TurnState::Captured);
    });
}

void TurnLifecycleService::beginTranscribing(const std::string& id,
                                             TranscriptionProvider provider,
                                             const std::optional<std::string>& locale) {
    Timestamp ts = now();
    mutate(id, [&](Turn& t) {
        t.transcriptionProvider = provider;
        t.transcriptionLocale = locale;
        if (!t.processingStartedAt) t.processingStartedAt = ts;
        transition(t, TurnState::Transcribing);
    });
}

void TurnLifecycleService::markTranscribedRaw(const std::string& id) {
    mutate(id, [&](Turn& t) {
        transition(t, TurnState::TranscribedRaw);
    });
}

void TurnLifecycleService::beginRedacting(const std::string& id) {
    mutate(id, [&](Turn& t) {
        transition(t, TurnState::Redacting);
    });
}

RedactionOutcome TurnLifecycleService::applyRedaction(const std::string& id,
                                                      const std::string& rawText,
                                                      const redaction::RedactionDictionary& dictionary,
                                                      bool persistRaw) {
    auto guard = m_locks.lock(id);
    auto turnOpt = m_repository->findById(id);
    if (!turnOpt) {
        throw NotFoundError("Turn not found: " + id);
    }
    Turn turn = std::move(*turnOpt);

    auto result = m_redactor.redact(rawText, dictionary);

    RedactionOutcome outcome;
    outcome.inputHash = result.inputHash;

    if (turn.redactionInputHash && *turn.redactionInputHash == result.inputHash &&
        turn.redactionVersion == dictionary.version) {
        outcome.applied = false;
        outcome.redactedText = turn.transcriptRedactedActive;
        outcome.redactionVersion = turn.redactionVersion;
        outcome.redactionTimestamp = turn.redactionTimestamp.value_or(now());
        return outcome;
    }

    Timestamp ts = now();
    turn.transcriptRedactedActive = result.redactedText;
    turn.redactionVersion = std::max(turn.redactionVersion, dictionary.version);
    turn.redactionTimestamp = ts;
    turn.redactionInputHash = result.inputHash;
    if (persistRaw) {
        turn.transcriptRaw = rawText;
    }

    RedactionRecord record;
    record.id = generateUUID();
    record.turnId = id;
    record.version = turn.redactionVersion;
    record.timestamp = ts;
    record.inputHash = result.inputHash;
    record.textRedacted = result.redactedText;

    m_repository->save(turn);
    m_repository->appendRedaction(record);

    outcome.applied = true;
    outcome.redactedText = result.redactedText;
    outcome.redactionVersion = turn.redactionVersion;
    outcome.redactionTimestamp = ts;
    return outcome;
}

RedactionOutcome TurnLifecycleService::reapplyRedaction(const std::string& id,
                                                        const redaction::RedactionDictionary& dictionary) {
    auto turn = get(id);
    if (!turn) {
        throw NotFoundError("Turn not found: " + id);
    }
    if (!turn->transcriptRaw) {
        RedactionOutcome outcome;
        outcome.redactedText = turn->transcriptRedactedActive;
        outcome.inputHash = turn->redactionInputHash.value_or("");
        outcome.redactionVersion = turn->redactionVersion;
        outcome.redactionTimestamp = turn->redactionTimestamp.value_or(now());
        return outcome;
    }
    return applyRedaction(id, *turn->transcriptRaw, dictionary, true);
}

void TurnLifecycleService::markReady(const std::string& id,
                                     Timestamp endedAt,
                                     const std::optional<std::string>& rawTranscript,
                                     const std::string& redactedTranscript,
                                     int redactionVersion,
                                     Timestamp redactionTimestamp,
                                     const std::optional<std::string>& autoTitle) {
    Timestamp ts = now();
    Turn saved = mutate(id, [&](Turn& t) {
        t.endedAt = endedAt;
        t.durationSeconds = durationSeconds(t.recordedAt, endedAt);
        if (rawTranscript) {
            t.transcriptRaw = rawTranscript;
        }
        t.transcriptRedactedActive = redactedTranscript;
        t.redactionVersion = std::max(t.redactionVersion, redactionVersion);
        t.redactionTimestamp = redactionTimestamp;

        if (autoTitle) {
            std::string candidate = trim(*autoTitle);
            if (!candidate.empty() && isUnsetTitle(t.title)) {
                t.title = candidate;
            }
        }

        t.processingFinishedAt = ts;
        transition(t, TurnState::Ready);
    });
    notifyCompleted(saved);
}

void TurnLifecycleService::markReadyPartial(const std::string& id, const std::string& redactedTranscript) {
    Timestamp ts = now();
    Turn saved = mutate(id, [&](Turn& t) {
        t.transcriptRedactedActive = redactedTranscript;
        t.processingFinishedAt = ts;
        transition(t, TurnState::ReadyPartial);
    });
    notifyCompleted(saved);
}

void TurnLifecycleService::markInterrupted(const std::string& id) {
    mutate(id, [&](Turn& t) {
        transition(t, TurnState::Interrupted);
    });
}

void TurnLifecycleService::markFailed(const std::string& id, const std::string& debugMessage) {
    TurnError error;
    error.domain = "capture";
    error.code = 1;
    error.debugMessage = debugMessage;
    markFailed(id, error);
}

void TurnLifecycleService::markFailed(const std::string& id, const TurnError& error) {
    Timestamp ts = now();
    mutate(id, [&](Turn& t) {
        t.error = error;
        t.processingFinishedAt = ts;
        transition(t, TurnState::Failed);
    });
    std::cerr << "[TurnLifecycle] Turn " << id << " failed (" << error.domain << "/" << error.code << ")" << std::endl;
}

void TurnLifecycleService::setTitle(const std::string& id, const std::string& title) {
    mutate(id, [&](Turn& t) {
        t.title = trim(title);
    });
}

void TurnLifecycleService::recordToolOutput(const std::string& id,
                                            ReflectTool tool,
                                            const std::string& text,
                                            const std::string& promptVersion,
                                            const std::optional<std::string>& capsuleSnapshotHash) {
    Timestamp ts = now();
    mutate(id, [&](Turn& t) {
        t.toolOutputs[tool] = ToolOutput{text, promptVersion, ts};
        t.reflectProvider = ReflectProvider::Gateway;
        t.promptVersion = promptVersion;
        if (capsuleSnapshotHash) t.capsuleSnapshotHash = capsuleSnapshotHash;
    });
}

void TurnLifecycleService::recordTalkExchange(const std::string& id,
                                              const std::string& userText,
                                              const std::string& reply,
                                              const std::optional<std::string>& responseId,
                                              const std::string& promptVersion,
                                              const std::optional<std::string>& capsuleSnapshotHash) {
    Timestamp ts = now();
    mutate(id, [&](Turn& t) {
        t.talkMessages.push_back({"user", userText, ts});
        t.talkMessages.push_back({"assistant", reply, ts});
        if (responseId) t.talkLastResponseId = responseId;
        t.talkPromptVersion = promptVersion;
        t.talkUpdatedAt = ts;
        if (capsuleSnapshotHash) t.capsuleSnapshotHash = capsuleSnapshotHash;
    });
}

void TurnLifecycleService::setLearningSnapshot(const std::string& id, const std::string& snapshotJson) {
    Timestamp ts = now();
    mutate(id, [&](Turn& t) {
        t.learningSnapshotJson = snapshotJson.empty() ? kEmptyLearningSnapshot : snapshotJson;
        t.learningSnapshotUpdatedAt = ts;
    });
}

void TurnLifecycleService::deleteTurn(const std::string& id) {
    auto guard = m_locks.lock(id);
    auto turn = m_repository->findById(id);
    if (!turn) {
        throw NotFoundError("Turn not found: " + id);
    }

    // Phase 1: cleanup. Failure is reported, never propagated.
    if (turn->audioPath && !turn->audioPath->empty() && m_audioStore) {
        try {
            m_audioStore->removeAudio(*turn->audioPath);
        } catch (const std::exception& e) {
            std::cerr << "[TurnLifecycle] Audio cleanup failed for " << id << ": " << e.what() << std::endl;
        }
    }

    // Phase 2: the record itself.
    m_repository->remove(id);
    m_repository->removeRedactions(id);
    std::cout << "[TurnLifecycle] Deleted turn " << id << std::endl;
}

std::optional<Turn> TurnLifecycleService::get(const std::string& id) {
    auto guard = m_locks.lock(id);
    return m_repository->findById(id);
}

std::vector<Turn> TurnLifecycleService::listNewestFirst() {
    auto turns = m_repository->findAll();
    std::sort(turns.begin(), turns.end(), [](const Turn& a, const Turn& b) {
        if (a.recordedAt != b.recordedAt) return a.recordedAt > b.recordedAt;
        return a.id < b.id;
    });
    return turns;
}

std::vector<RedactionRecord> TurnLifecycleService::redactionHistory(const std::string& id) {
    auto records = m_repository->redactionsFor(id);
    std::stable_sort(records.begin(), records.end(), [](const RedactionRecord& a, const RedactionRecord& b) {
        return a.timestamp < b.timestamp;
    });
    return records;
}

void TurnLifecycleService::setCompletionHandler(CompletionHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_onCompleted = std::move(handler);
}

void TurnLifecycleService::notifyCompleted(const Turn& turn) {
    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_onCompleted;
    }
    if (!handler) return;

    // The Turn is already persisted; a failing listener must not undo the transition.
    try {
        handler(turn);
    } catch (const std::exception& e) {
        std::cerr << "[TurnLifecycle] Completion handler failed for " << turn.id << ": " << e.what() << std::endl;
    }
}

} // namespace reflectcore::application
