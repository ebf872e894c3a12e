#include "services/transfer/transfer_job.hpp"
#include "services/transfer/destination_backend.hpp"
#include "services/transfer/dicom_stager.hpp"
#include "services/transfer/store_association.hpp"

#include "core/logging.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <random>
#include <system_error>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("TransferJob");
    return logger;
}

std::string randomHex() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    std::lock_guard lock(mutex);
    return std::format("{:016x}", engine());
}

} // anonymous namespace

class TransferJob::Impl {
public:
    Impl(std::filesystem::path source, DestinationConfig dest, TransferJobOptions opts)
        : sourceRoot(std::move(source))
        , destination(std::move(dest))
        , options(std::move(opts)) {
    }

    std::filesystem::path sourceRoot;
    DestinationConfig destination;
    TransferJobOptions options;
    std::shared_ptr<IStoreAssociationFactory> associationFactory;

    CancellationToken token;
    std::atomic<JobState> state{JobState::Idle};

    std::atomic<int32_t> found{0};
    std::atomic<int32_t> staged{0};
    std::atomic<int32_t> dispatched{0};
    std::atomic<int32_t> failed{0};

    mutable std::mutex workDirMutex;
    std::filesystem::path workDir;

    void setState(JobState next) {
        JobState previous = state.exchange(next);
        getLogger()->debug("{} -> {}", toString(previous), toString(next));
    }

    std::expected<std::filesystem::path, TransferErrorInfo> createWorkingDirectory() {
        std::error_code ec;
        std::filesystem::path parent = options.stagingParent;
        if (parent.empty()) {
            parent = std::filesystem::temp_directory_path(ec);
            if (ec) {
                return std::unexpected(TransferErrorInfo{
                    TransferError::IoError,
                    "Cannot determine temp directory: " + ec.message(),
                    JobState::Scanning
                });
            }
        }

        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(TransferErrorInfo{
                TransferError::IoError,
                "Cannot create staging parent " + parent.string() + ": " + ec.message(),
                JobState::Scanning
            });
        }

        constexpr int maxAttempts = 8;
        for (int attempt = 0; attempt < maxAttempts; ++attempt) {
            auto candidate = parent / (std::string(WORK_DIR_PREFIX) + randomHex());
            // create_directory returns false if the name is taken
            if (std::filesystem::create_directory(candidate, ec)) {
                std::lock_guard lock(workDirMutex);
                workDir = candidate;
                return candidate;
            }
            if (ec) {
                return std::unexpected(TransferErrorInfo{
                    TransferError::IoError,
                    "Cannot create working directory under " + parent.string() +
                        ": " + ec.message(),
                    JobState::Scanning
                });
            }
        }

        return std::unexpected(TransferErrorInfo{
            TransferError::IoError,
            "Cannot find a free working directory name under " + parent.string(),
            JobState::Scanning
        });
    }

    void cleanup(const ProgressSink& progress) {
        setState(JobState::Cleaning);

        std::filesystem::path dir;
        {
            std::lock_guard lock(workDirMutex);
            dir = workDir;
        }
        if (progress) {
            progress(ProgressEvent{
                .phase = JobState::Cleaning,
                .found = found.load(),
                .processed = dispatched.load(),
                .total = staged.load(),
                .currentFileName = dir.filename().string()
            });
        }
        if (dir.empty()) {
            return;
        }

        std::error_code ec;
        auto removed = std::filesystem::remove_all(dir, ec);
        if (ec) {
            getLogger()->warn("Failed to remove working directory {}: {}",
                              dir.string(), ec.message());
        } else {
            getLogger()->debug("Removed {} entries from {}", removed, dir.string());
        }
    }

    JobResult finish(JobResult result, JobState finalState, const ProgressSink& progress) {
        cleanup(progress);
        result.finalState = finalState;
        setState(finalState);

        if (finalState == JobState::Failed && result.error) {
            getLogger()->error("Transfer failed: {}", result.error->toString());
        } else {
            getLogger()->info("Transfer {}: {} found, {} staged, {} dispatched, {} failed",
                              toString(finalState), result.filesFound, result.filesStaged,
                              result.filesDispatched, result.filesFailed);
        }
        return result;
    }

    JobResult fail(JobResult result, TransferErrorInfo error, const ProgressSink& progress) {
        result.error = std::move(error);
        return finish(std::move(result), JobState::Failed, progress);
    }

    JobResult execute(const ProgressSink& progress) {
        JobResult result;

        auto observe = [this, &progress](const ProgressEvent& event) {
            if (event.phase == JobState::Scanning) {
                found.store(event.found);
                staged.store(event.processed);
            } else if (event.phase == JobState::Dispatching) {
                dispatched.store(event.processed);
            }
            if (progress) {
                progress(event);
            }
        };

        setState(JobState::Scanning);
        getLogger()->info("Starting {} transfer from {}",
                          destinationKind(destination), sourceRoot.string());

        auto dir = createWorkingDirectory();
        if (!dir) {
            return fail(std::move(result), dir.error(), progress);
        }

        DicomStager stager;
        auto stageResult = stager.stage(sourceRoot, *dir, observe, &token);
        if (!stageResult) {
            return fail(std::move(result), stageResult.error(), progress);
        }

        result.filesFound = stageResult->counts.found;
        result.filesStaged = stageResult->counts.staged;
        result.filesFailed = static_cast<int32_t>(stageResult->skipped.size());
        result.outcomes = std::move(stageResult->skipped);
        found.store(result.filesFound);
        staged.store(result.filesStaged);
        failed.store(result.filesFailed);

        if (stageResult->cancelled) {
            return finish(std::move(result), JobState::Cancelled, progress);
        }

        setState(JobState::Staged);

        if (stageResult->objects.empty()) {
            getLogger()->info("No DICOM objects found under {}", sourceRoot.string());
            return finish(std::move(result), JobState::Done, progress);
        }

        setState(JobState::Dispatching);
        auto backend = makeDestinationBackend(destination, associationFactory);
        auto dispatchResult = backend->dispatch(stageResult->objects, observe, token);
        if (!dispatchResult) {
            TransferErrorInfo error = dispatchResult.error();
            error.phase = JobState::Dispatching;
            return fail(std::move(result), std::move(error), progress);
        }

        result.filesDispatched = dispatchResult->acceptedCount();
        result.filesFailed += dispatchResult->rejectedCount();
        for (auto& outcome : dispatchResult->outcomes) {
            result.outcomes.push_back(std::move(outcome));
        }
        dispatched.store(result.filesDispatched);
        failed.store(result.filesFailed);

        return finish(std::move(result),
                      dispatchResult->cancelled ? JobState::Cancelled : JobState::Done,
                      progress);
    }
};

TransferJob::TransferJob(std::filesystem::path sourceRoot,
                         DestinationConfig destination,
                         TransferJobOptions options)
    : impl_(std::make_unique<Impl>(std::move(sourceRoot), std::move(destination),
                                   std::move(options))) {
}

TransferJob::~TransferJob() = default;

TransferJob::TransferJob(TransferJob&&) noexcept = default;
TransferJob& TransferJob::operator=(TransferJob&&) noexcept = default;

void TransferJob::setAssociationFactory(std::shared_ptr<IStoreAssociationFactory> factory) {
    impl_->associationFactory = std::move(factory);
}

JobResult TransferJob::run(const ProgressSink& progress) {
    if (impl_->state.load() != JobState::Idle) {
        JobResult result;
        result.finalState = JobState::Failed;
        result.error = TransferErrorInfo{
            TransferError::ConfigError,
            "Transfer job has already been run",
            impl_->state.load()
        };
        return result;
    }

    if (!isValid(impl_->destination)) {
        JobResult result;
        result.finalState = JobState::Failed;
        result.error = TransferErrorInfo{
            TransferError::ConfigError,
            std::format("Invalid {} destination configuration",
                        destinationKind(impl_->destination)),
            JobState::Idle
        };
        impl_->setState(JobState::Failed);
        getLogger()->error("{}", result.error->toString());
        return result;
    }

    try {
        return impl_->execute(progress);
    } catch (const std::exception& e) {
        JobResult result;
        result.filesFound = impl_->found.load();
        result.filesStaged = impl_->staged.load();
        return impl_->fail(std::move(result), TransferErrorInfo{
            TransferError::IoError,
            std::string("Unexpected error: ") + e.what(),
            impl_->state.load()
        }, progress);
    }
}

void TransferJob::cancel() noexcept {
    getLogger()->info("Cancellation requested");
    impl_->token.requestCancel();
}

CancellationToken TransferJob::cancellationToken() const {
    return impl_->token;
}

JobState TransferJob::state() const noexcept {
    return impl_->state.load();
}

JobCounters TransferJob::counters() const noexcept {
    return JobCounters{
        .found = impl_->found.load(),
        .staged = impl_->staged.load(),
        .dispatched = impl_->dispatched.load(),
        .failed = impl_->failed.load()
    };
}

std::filesystem::path TransferJob::workingDirectory() const {
    std::lock_guard lock(impl_->workDirMutex);
    return impl_->workDir;
}

const std::filesystem::path& TransferJob::sourceRoot() const noexcept {
    return impl_->sourceRoot;
}

const DestinationConfig& TransferJob::destination() const noexcept {
    return impl_->destination;
}

} // namespace dicom_transfer::services
