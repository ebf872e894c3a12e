#include "services/transfer/transfer_types.hpp"

#include <algorithm>
#include <format>

namespace dicom_transfer::services {

std::string_view toString(JobState state) noexcept {
    switch (state) {
        case JobState::Idle:        return "Idle";
        case JobState::Scanning:    return "Scanning";
        case JobState::Staged:      return "Staged";
        case JobState::Dispatching: return "Dispatching";
        case JobState::Cleaning:    return "Cleaning";
        case JobState::Done:        return "Done";
        case JobState::Failed:      return "Failed";
        case JobState::Cancelled:   return "Cancelled";
    }
    return "Unknown";
}

std::string_view toString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Accepted: return "Accepted";
        case OutcomeKind::Rejected: return "Rejected";
        case OutcomeKind::Skipped:  return "Skipped";
    }
    return "Unknown";
}

std::string TransferErrorInfo::codeToString(TransferError code) {
    switch (code) {
        case TransferError::ValidationSkip:   return "ValidationSkip";
        case TransferError::IoError:          return "IoError";
        case TransferError::ConfigError:      return "ConfigError";
        case TransferError::AssociationError: return "AssociationError";
        case TransferError::StoreRejected:    return "StoreRejected";
        case TransferError::Timeout:          return "Timeout";
        case TransferError::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

std::string TransferErrorInfo::toString() const {
    return std::format("[{}] {} (phase: {})",
                       codeToString(code), message, services::toString(phase));
}

TransferOutcome TransferOutcome::accepted(const StagedObject& object,
                                          std::optional<uint16_t> status) {
    TransferOutcome outcome;
    outcome.kind = OutcomeKind::Accepted;
    outcome.path = object.stagedPath;
    outcome.sequenceIndex = object.sequenceIndex;
    outcome.dimseStatus = status;
    return outcome;
}

TransferOutcome TransferOutcome::rejected(const StagedObject& object, std::string reason,
                                          std::optional<uint16_t> status) {
    TransferOutcome outcome;
    outcome.kind = OutcomeKind::Rejected;
    outcome.reason = std::move(reason);
    outcome.path = object.stagedPath;
    outcome.sequenceIndex = object.sequenceIndex;
    outcome.dimseStatus = status;
    return outcome;
}

TransferOutcome TransferOutcome::skipped(std::filesystem::path path, std::string reason) {
    TransferOutcome outcome;
    outcome.kind = OutcomeKind::Skipped;
    outcome.reason = std::move(reason);
    outcome.path = std::move(path);
    return outcome;
}

bool isValid(const DestinationConfig& destination) noexcept {
    return std::visit([](const auto& config) { return config.isValid(); }, destination);
}

std::string_view destinationKind(const DestinationConfig& destination) noexcept {
    return std::holds_alternative<FolderDestination>(destination) ? "folder" : "pacs";
}

int32_t DispatchResult::acceptedCount() const noexcept {
    return static_cast<int32_t>(std::ranges::count_if(
        outcomes, [](const TransferOutcome& o) { return o.isAccepted(); }));
}

int32_t DispatchResult::rejectedCount() const noexcept {
    return static_cast<int32_t>(outcomes.size()) - acceptedCount();
}

std::string sequenceFileName(std::string_view prefix, uint32_t sequenceIndex) {
    return std::format("{}_{:06}.dcm", prefix, sequenceIndex);
}

} // namespace dicom_transfer::services
