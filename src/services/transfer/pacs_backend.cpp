#include "services/transfer/pacs_backend.hpp"

#include "core/logging.hpp"

#include <format>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("PacsBackend");
    return logger;
}

TransferOutcome outcomeFromResponse(const StagedObject& object, const StoreResponse& response) {
    if (response.isSuccess()) {
        return TransferOutcome::accepted(object, response.status);
    }

    std::string reason = std::format("status 0x{:04X}", response.status);
    if (!response.errorComment.empty()) {
        reason += ": " + response.errorComment;
    }
    return TransferOutcome::rejected(object, std::move(reason), response.status);
}

TransferOutcome outcomeFromFailure(const StagedObject& object, const StoreFailureInfo& failure) {
    if (failure.code == StoreFailure::Timeout) {
        return TransferOutcome::rejected(object, "timeout");
    }
    return TransferOutcome::rejected(object, failure.message);
}

} // anonymous namespace

PacsBackend::PacsBackend(PacsServerConfig config,
                         std::shared_ptr<IStoreAssociationFactory> factory)
    : config_(std::move(config))
    , factory_(factory ? std::move(factory)
                       : std::make_shared<DcmtkStoreAssociationFactory>()) {
}

std::expected<DispatchResult, TransferErrorInfo>
PacsBackend::dispatch(const std::vector<StagedObject>& objects,
                      const ProgressSink& progress,
                      const CancellationToken& cancel) {
    if (!config_.isValid()) {
        return std::unexpected(TransferErrorInfo{
            TransferError::ConfigError,
            "Invalid PACS server configuration",
            JobState::Dispatching
        });
    }

    DispatchResult result;
    if (objects.empty()) {
        return result;
    }
    if (cancel.isCancelled()) {
        result.cancelled = true;
        return result;
    }

    auto association = factory_->associate(config_);
    if (!association) {
        getLogger()->error("Association with {}:{} failed: {}",
                           config_.hostname, config_.port, association.error().toString());
        return std::unexpected(TransferErrorInfo{
            TransferError::AssociationError,
            association.error().toString(),
            JobState::Dispatching
        });
    }
    std::unique_ptr<IStoreAssociation> assoc = std::move(*association);

    getLogger()->info("Sending {} objects to {} at {}:{}",
                      objects.size(), config_.calledAeTitle, config_.hostname, config_.port);

    const auto ordered = inSequenceOrder(objects);
    const auto total = static_cast<int32_t>(ordered.size());

    for (size_t i = 0; i < ordered.size(); ++i) {
        const StagedObject& object = *ordered[i];

        if (cancel.isCancelled()) {
            getLogger()->info("Dispatch cancelled after {} of {} objects",
                              result.outcomes.size(), ordered.size());
            result.cancelled = true;
            break;
        }

        // A timed-out or broken exchange leaves the association unusable
        if (assoc->state() != AssociationState::Open) {
            getLogger()->warn("Association {} after previous object, reconnecting",
                              toString(assoc->state()));
            auto reopened = factory_->associate(config_);
            if (!reopened) {
                std::string reason = "association lost: " + reopened.error().message;
                getLogger()->error("Reconnect failed; rejecting {} remaining objects",
                                   ordered.size() - i);
                for (size_t j = i; j < ordered.size(); ++j) {
                    result.outcomes.push_back(TransferOutcome::rejected(*ordered[j], reason));
                }
                break;
            }
            assoc = std::move(*reopened);
        }

        auto response = assoc->store(object.stagedPath, config_.dimseTimeout);
        TransferOutcome outcome = response ? outcomeFromResponse(object, *response)
                                           : outcomeFromFailure(object, response.error());

        if (outcome.isAccepted()) {
            getLogger()->debug("Stored {}", object.stagedPath.filename().string());
        } else {
            getLogger()->warn("Store of {} rejected: {}",
                              object.stagedPath.filename().string(), outcome.reason);
        }
        result.outcomes.push_back(std::move(outcome));

        if (progress) {
            progress(ProgressEvent{
                .phase = JobState::Dispatching,
                .found = total,
                .processed = static_cast<int32_t>(result.outcomes.size()),
                .total = total,
                .currentFileName = object.stagedPath.filename().string()
            });
        }
    }

    assoc->release();

    getLogger()->info("PACS dispatch finished: {} accepted, {} rejected",
                      result.acceptedCount(), result.rejectedCount());
    return result;
}

} // namespace dicom_transfer::services
