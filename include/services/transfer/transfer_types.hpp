// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file transfer_types.hpp
 * @brief Value types shared by the staging, dispatch and job layers
 * @details Defines the job state machine, the error taxonomy, staged object
 *          records, per-object outcomes, destination configuration, progress
 *          events, the cooperative cancellation token and the job result.
 *
 * ## Thread Safety
 * - All types except CancellationToken are plain values
 * - CancellationToken copies share one atomic flag and may be used from
 *   any thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/pacs_config.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dicom_transfer::services {

/**
 * @brief Phases of a transfer job
 *
 * Idle -> Scanning -> Staged -> Dispatching -> Cleaning -> Done.
 * Failed is reachable from any non-terminal state, Cancelled from
 * Scanning and Dispatching (through Cleaning).
 */
enum class JobState {
    Idle,
    Scanning,
    Staged,
    Dispatching,
    Cleaning,
    Done,
    Failed,
    Cancelled
};

[[nodiscard]] std::string_view toString(JobState state) noexcept;

/**
 * @brief Whether a job in this state has finished
 */
[[nodiscard]] constexpr bool isTerminal(JobState state) noexcept {
    return state == JobState::Done ||
           state == JobState::Failed ||
           state == JobState::Cancelled;
}

/**
 * @brief Error taxonomy of the transfer pipeline
 */
enum class TransferError {
    ValidationSkip,    ///< Not a DICOM object; excluded, never fatal
    IoError,           ///< Unreadable or uncopyable file or directory
    ConfigError,       ///< Missing or malformed destination configuration
    AssociationError,  ///< Association could not be negotiated
    StoreRejected,     ///< Server refused one object
    Timeout,           ///< Request exceeded its time bound
    Cancelled          ///< Job was cancelled
};

/**
 * @brief Detailed error information with the phase it was raised in
 */
struct TransferErrorInfo {
    TransferError code;
    std::string message;
    JobState phase = JobState::Idle;

    /**
     * @brief Get human-readable error description
     */
    [[nodiscard]] std::string toString() const;

    static std::string codeToString(TransferError code);
};

/// Candidate file discovered during a source walk
struct SourceEntry {
    std::filesystem::path path;
    std::uintmax_t size = 0;
};

/// Validated DICOM object copied into a job's working directory
struct StagedObject {
    /// Where the object was found on the source medium
    std::filesystem::path sourcePath;

    /// Copy inside the working directory
    std::filesystem::path stagedPath;

    /// Monotonic index assigned at staging time
    uint32_t sequenceIndex = 0;

    /// Size in bytes
    std::uintmax_t byteSize = 0;
};

/**
 * @brief Kind of per-object result
 */
enum class OutcomeKind {
    Accepted,
    Rejected,
    Skipped
};

[[nodiscard]] std::string_view toString(OutcomeKind kind) noexcept;

/**
 * @brief Per-object result of staging or dispatch
 */
struct TransferOutcome {
    OutcomeKind kind = OutcomeKind::Accepted;

    /// Reason for Rejected or Skipped; empty when Accepted
    std::string reason;

    /// File the outcome refers to
    std::filesystem::path path;

    /// Sequence index, when the object was staged
    std::optional<uint32_t> sequenceIndex;

    /// DIMSE status returned by the server (PACS dispatch only)
    std::optional<uint16_t> dimseStatus;

    [[nodiscard]] bool isAccepted() const noexcept { return kind == OutcomeKind::Accepted; }

    static TransferOutcome accepted(const StagedObject& object,
                                    std::optional<uint16_t> status = std::nullopt);
    static TransferOutcome rejected(const StagedObject& object, std::string reason,
                                    std::optional<uint16_t> status = std::nullopt);
    static TransferOutcome skipped(std::filesystem::path path, std::string reason);
};

/// Folder destination
struct FolderDestination {
    std::filesystem::path path;

    [[nodiscard]] bool isValid() const noexcept { return !path.empty(); }
};

/// Closed set of destinations a job can dispatch to
using DestinationConfig = std::variant<FolderDestination, PacsServerConfig>;

/**
 * @brief Check the destination before any file is touched
 */
[[nodiscard]] bool isValid(const DestinationConfig& destination) noexcept;

/**
 * @brief Short name of the destination kind ("folder" or "pacs")
 */
[[nodiscard]] std::string_view destinationKind(const DestinationConfig& destination) noexcept;

/**
 * @brief Progress information published while a job runs
 */
struct ProgressEvent {
    /// Phase that produced the event
    JobState phase = JobState::Idle;

    /// Files inspected so far
    int32_t found = 0;

    /// Objects staged (Scanning) or dispatched (Dispatching) so far
    int32_t processed = 0;

    /// Total work items of the current phase
    int32_t total = 0;

    /// File being handled when the event was emitted
    std::string currentFileName;

    /**
     * @brief Get completion percentage of the current phase (0-100)
     */
    [[nodiscard]] float percentComplete() const noexcept {
        if (total <= 0) return 0.0f;
        int32_t done = phase == JobState::Scanning ? found : processed;
        return static_cast<float>(done) / static_cast<float>(total) * 100.0f;
    }
};

/// Progress callback; invoked on the thread running the job
using ProgressSink = std::function<void(const ProgressEvent&)>;

/**
 * @brief Cooperative cancellation flag
 *
 * Copies share state. Loops check it between objects, never in the middle
 * of a copy or a store.
 */
class CancellationToken {
public:
    CancellationToken()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
    }

    void requestCancel() noexcept { cancelled_->store(true); }

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

/**
 * @brief Outcomes returned by a destination backend
 */
struct DispatchResult {
    std::vector<TransferOutcome> outcomes;

    /// Whether the loop stopped early on cancellation
    bool cancelled = false;

    [[nodiscard]] int32_t acceptedCount() const noexcept;
    [[nodiscard]] int32_t rejectedCount() const noexcept;
};

/**
 * @brief Final report of a transfer job
 */
struct JobResult {
    int32_t filesFound = 0;
    int32_t filesStaged = 0;
    int32_t filesDispatched = 0;
    int32_t filesFailed = 0;

    /// Staging skips first, then dispatch outcomes in sequence order
    std::vector<TransferOutcome> outcomes;

    JobState finalState = JobState::Idle;

    /// Set when finalState is Failed
    std::optional<TransferErrorInfo> error;

    [[nodiscard]] bool succeeded() const noexcept { return finalState == JobState::Done; }
};

/**
 * @brief Build "<prefix>_NNNNNN.dcm" from a sequence index
 */
[[nodiscard]] std::string sequenceFileName(std::string_view prefix, uint32_t sequenceIndex);

} // namespace dicom_transfer::services
