#include "services/transfer/folder_backend.hpp"

#include "core/logging.hpp"

#include <system_error>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("FolderBackend");
    return logger;
}

} // anonymous namespace

FolderBackend::FolderBackend(FolderDestination destination)
    : destination_(std::move(destination)) {
}

std::expected<DispatchResult, TransferErrorInfo>
FolderBackend::dispatch(const std::vector<StagedObject>& objects,
                        const ProgressSink& progress,
                        const CancellationToken& cancel) {
    if (!destination_.isValid()) {
        return std::unexpected(TransferErrorInfo{
            TransferError::ConfigError,
            "Destination folder path is empty",
            JobState::Dispatching
        });
    }

    std::error_code ec;
    std::filesystem::create_directories(destination_.path, ec);
    if (ec || !std::filesystem::is_directory(destination_.path)) {
        return std::unexpected(TransferErrorInfo{
            TransferError::ConfigError,
            "Cannot create destination folder " + destination_.path.string() +
                (ec ? ": " + ec.message() : std::string()),
            JobState::Dispatching
        });
    }

    getLogger()->info("Exporting {} objects to {}", objects.size(), destination_.path.string());

    DispatchResult result;
    const auto total = static_cast<int32_t>(objects.size());

    for (const StagedObject* object : inSequenceOrder(objects)) {
        if (cancel.isCancelled()) {
            getLogger()->info("Export cancelled after {} of {} objects",
                              result.outcomes.size(), objects.size());
            result.cancelled = true;
            break;
        }

        auto target = destination_.path / sequenceFileName(EXPORT_FILE_PREFIX,
                                                           object->sequenceIndex);

        std::filesystem::copy_file(object->stagedPath, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            getLogger()->warn("Failed to export {}: {}", object->stagedPath.string(), ec.message());
            result.outcomes.push_back(TransferOutcome::rejected(*object, ec.message()));
        } else {
            getLogger()->debug("Exported {}", target.string());
            result.outcomes.push_back(TransferOutcome::accepted(*object));
        }

        if (progress) {
            progress(ProgressEvent{
                .phase = JobState::Dispatching,
                .found = total,
                .processed = static_cast<int32_t>(result.outcomes.size()),
                .total = total,
                .currentFileName = target.filename().string()
            });
        }
    }

    getLogger()->info("Folder export finished: {} copied, {} failed",
                      result.acceptedCount(), result.rejectedCount());
    return result;
}

} // namespace dicom_transfer::services
