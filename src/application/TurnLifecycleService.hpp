/**
 * @file TurnLifecycleService.hpp
 * @brief Application Service owning every mutation of a Turn, from capture start to deletion.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/KeyedMutex.hpp"
#include "domain/redaction/Redactor.hpp"
#include "domain/turn/TurnRepository.hpp"

namespace reflectcore::application {

using domain::Timestamp;
using domain::turn::CaptureContext;
using domain::turn::RedactionRecord;
using domain::turn::Turn;
using domain::turn::TurnError;

/**
 * @struct RedactionOutcome
 * @brief Result of applying the redaction engine to a Turn.
 */
struct RedactionOutcome {
    bool applied = false;       ///< false when input hash and dictionary version were unchanged
    std::string redactedText;
    std::string inputHash;
    int redactionVersion = 1;
    Timestamp redactionTimestamp;
};

/**
 * @class TurnLifecycleService
 * @brief State machine for capture records.
 *
 * All mutations of one Turn are serialized through a per-id lock; different Turns proceed
 * concurrently. Transitions are not legality-checked: duplicated or out-of-order pipeline
 * callbacks are accepted, and callers are responsible for pipeline order.
 * Every method that takes an id throws domain::NotFoundError for unknown ids, and
 * storage failures propagate as domain::StorageError.
 */
class TurnLifecycleService {
public:
    using Clock = std::function<Timestamp()>;
    using CompletionHandler = std::function<void(const Turn&)>;

    TurnLifecycleService(std::shared_ptr<domain::turn::TurnRepository> repository,
                         std::shared_ptr<domain::turn::AudioStore> audioStore,
                         Clock clock = nullptr);

    // --- Creation ---

    /**
     * @brief Allocates a Turn in Queued and persists it.
     * @return The new Turn id.
     */
    std::string createCapture(const std::optional<std::string>& audioPath,
                              Timestamp recordedAt,
                              CaptureContext context);

    /**
     * @brief Creates a Turn directly in Ready from already-redacted text. No raw transcript is stored.
     * @throws domain::ValidationError if the text is blank or whitespace-only.
     */
    std::string createTextImport(const std::string& redactedText,
                                 Timestamp recordedAt,
                                 CaptureContext context);

    // --- Pipeline ---
    void beginRecording(const std::string& id);

    /**
     * @brief Records the end of audio capture.
     * @throws domain::ValidationError if audioBytes > 0 and the Turn has no audio path.
     */
    void markCaptured(const std::string& id,
                      std::optional<Timestamp> endedAt,
                      std::int64_t audioBytes,
                      const std::optional<std::string>& audioPath = std::nullopt);

    void beginTranscribing(const std::string& id,
                           domain::turn::TranscriptionProvider provider,
                           const std::optional<std::string>& locale);

    /**
     * @brief Raw text has arrived from the transcription engine; redaction has not run yet.
     */
    void markTranscribedRaw(const std::string& id);
    void beginRedacting(const std::string& id);

    /**
     * @brief Runs the redaction engine on freshly transcribed text and stores the result as the
     * canonical transcript, appending a RedactionRecord.
     *
     * Skipped (no record appended) when the input hash and dictionary version match what the
     * Turn was last redacted with. The raw text is stored only if @p persistRaw is true.
     */
    RedactionOutcome applyRedaction(const std::string& id,
                                    const std::string& rawText,
                                    const domain::redaction::RedactionDictionary& dictionary,
                                    bool persistRaw);

    /**
     * @brief Re-runs redaction over the stored raw transcript (e.g. after a dictionary edit).
     * Returns an outcome with applied == false if no raw transcript is stored.
     */
    RedactionOutcome reapplyRedaction(const std::string& id,
                                      const domain::redaction::RedactionDictionary& dictionary);

    /**
     * @brief Completes the pipeline.
     *
     * Duration is max(0, endedAt - recordedAt). The raw transcript is stored only if supplied.
     * Redaction version becomes max(current, supplied). The auto title is applied only while the
     * current title is blank or the "Untitled" placeholder. Allowed from any state; a prior
     * failure is cleared.
     */
    void markReady(const std::string& id,
                   Timestamp endedAt,
                   const std::optional<std::string>& rawTranscript,
                   const std::string& redactedTranscript,
                   int redactionVersion,
                   Timestamp redactionTimestamp,
                   const std::optional<std::string>& autoTitle);

    void markReadyPartial(const std::string& id, const std::string& redactedTranscript);
    void markInterrupted(const std::string& id);

    /**
     * @brief Moves the Turn to Failed. Transcripts already captured are preserved.
     */
    void markFailed(const std::string& id, const std::string& debugMessage);
    void markFailed(const std::string& id, const TurnError& error);

    // --- Edits ---
    void setTitle(const std::string& id, const std::string& title);

    void recordToolOutput(const std::string& id,
                          domain::turn::ReflectTool tool,
                          const std::string& text,
                          const std::string& promptVersion,
                          const std::optional<std::string>& capsuleSnapshotHash);

    void recordTalkExchange(const std::string& id,
                            const std::string& userText,
                            const std::string& reply,
                            const std::optional<std::string>& responseId,
                            const std::string& promptVersion,
                            const std::optional<std::string>& capsuleSnapshotHash);

    void setLearningSnapshot(const std::string& id, const std::string& snapshotJson);

    /**
     * @brief Best-effort audio removal, then removal of the record and its redaction log.
     * Audio failures are logged, never thrown.
     */
    void deleteTurn(const std::string& id);

    // --- Queries ---
    std::optional<Turn> get(const std::string& id);
    std::vector<Turn> listNewestFirst();
    std::vector<RedactionRecord> redactionHistory(const std::string& id);

    /**
     * @brief Invoked after a Turn reaches Ready or ReadyPartial, outside the Turn's lock.
     */
    void setCompletionHandler(CompletionHandler handler);

private:
    template <typename Fn>
    Turn mutate(const std::string& id, Fn&& fn);

    void notifyCompleted(const Turn& turn);
    Timestamp now() const;

    std::shared_ptr<domain::turn::TurnRepository> m_repository;
    std::shared_ptr<domain::turn::AudioStore> m_audioStore;
    Clock m_clock;
    domain::redaction::Redactor m_redactor;
    KeyedMutex m_locks;

    std::mutex m_handlerMutex;
    CompletionHandler m_onCompleted;
};

} // namespace reflectcore::application
