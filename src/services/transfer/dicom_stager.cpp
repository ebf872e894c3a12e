#include "services/transfer/dicom_stager.hpp"

#include "core/dicom_validator.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <charconv>
#include <set>
#include <string>
#include <system_error>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("Stager");
    return logger;
}

} // anonymous namespace

class DicomStager::Impl {
public:
    std::expected<std::vector<SourceEntry>, TransferErrorInfo>
    discover(const std::filesystem::path& sourceRoot) const {
        std::error_code ec;
        if (!std::filesystem::is_directory(sourceRoot, ec)) {
            return std::unexpected(TransferErrorInfo{
                TransferError::IoError,
                "Source directory not found: " + sourceRoot.string(),
                JobState::Scanning
            });
        }

        auto canonicalRoot = std::filesystem::canonical(sourceRoot, ec);
        if (ec) {
            return std::unexpected(TransferErrorInfo{
                TransferError::IoError,
                "Cannot resolve source directory " + sourceRoot.string() + ": " + ec.message(),
                JobState::Scanning
            });
        }

        std::vector<SourceEntry> entries;
        std::set<std::filesystem::path> visited{canonicalRoot};

        if (!walkDirectory(sourceRoot, visited, entries)) {
            return std::unexpected(TransferErrorInfo{
                TransferError::IoError,
                "Cannot read source directory: " + sourceRoot.string(),
                JobState::Scanning
            });
        }

        getLogger()->debug("Discovered {} files under {}", entries.size(), sourceRoot.string());
        return entries;
    }

    std::expected<StageResult, TransferErrorInfo> stage(
        const std::filesystem::path& sourceRoot,
        const std::filesystem::path& workDir,
        const ProgressSink& progress,
        const CancellationToken* cancel
    ) {
        std::error_code ec;
        if (!std::filesystem::is_directory(workDir, ec)) {
            return std::unexpected(TransferErrorInfo{
                TransferError::IoError,
                "Working directory does not exist: " + workDir.string(),
                JobState::Scanning
            });
        }

        auto entries = discover(sourceRoot);
        if (!entries) {
            return std::unexpected(entries.error());
        }

        getLogger()->info("Scanning {} files under {}", entries->size(), sourceRoot.string());

        StageResult result;
        nextSequenceIndex_ = firstFreeSequenceIndex(workDir);
        if (nextSequenceIndex_ > 0) {
            getLogger()->info("{} already holds staged objects, numbering from {}",
                              workDir.string(), nextSequenceIndex_);
        }
        const auto total = static_cast<int32_t>(entries->size());

        for (const auto& entry : *entries) {
            if (cancel && cancel->isCancelled()) {
                getLogger()->info("Staging cancelled after {} of {} files",
                                  result.counts.totalScanned, total);
                result.cancelled = true;
                break;
            }

            ++result.counts.totalScanned;
            ++result.counts.found;

            if (core::DicomValidator::isDicomObject(entry.path)) {
                stageObject(entry, workDir, result);
            } else {
                getLogger()->trace("Not a DICOM object: {}", entry.path.string());
            }

            if (progress) {
                progress(ProgressEvent{
                    .phase = JobState::Scanning,
                    .found = result.counts.found,
                    .processed = result.counts.staged,
                    .total = total,
                    .currentFileName = entry.path.filename().string()
                });
            }
        }

        getLogger()->info("Staging finished: {} found, {} staged, {} skipped",
                          result.counts.found, result.counts.staged, result.counts.skipped);
        return result;
    }

private:
    uint32_t nextSequenceIndex_ = 0;

    /// One past the highest object_N regular file already present in workDir
    static uint32_t firstFreeSequenceIndex(const std::filesystem::path& workDir) {
        const std::string prefix = std::string(STAGED_FILE_PREFIX) + "_";
        uint32_t next = 0;

        std::error_code ec;
        for (std::filesystem::directory_iterator it(workDir, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (!it->is_regular_file(ec) || it->path().extension() != ".dcm") {
                continue;
            }
            auto stem = it->path().stem().string();
            if (!stem.starts_with(prefix)) {
                continue;
            }
            const char* first = stem.data() + prefix.size();
            const char* last = stem.data() + stem.size();
            uint32_t index = 0;
            auto [ptr, parseEc] = std::from_chars(first, last, index);
            if (parseEc == std::errc{} && ptr == last && first != last && index >= next) {
                next = index + 1;
            }
        }
        return next;
    }

    bool walkDirectory(const std::filesystem::path& directory,
                       std::set<std::filesystem::path>& visited,
                       std::vector<SourceEntry>& entries) const {
        std::error_code ec;
        std::filesystem::directory_iterator it(
            directory, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            getLogger()->warn("Cannot read directory {}: {}", directory.string(), ec.message());
            return false;
        }

        std::vector<std::filesystem::directory_entry> children;
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) {
                getLogger()->warn("Error while listing {}: {}", directory.string(), ec.message());
                break;
            }
            children.push_back(*it);
        }
        std::ranges::sort(children, {}, &std::filesystem::directory_entry::path);

        for (const auto& child : children) {
            auto status = child.status(ec);
            if (ec) {
                getLogger()->debug("Skipping unreadable entry {}: {}",
                                   child.path().string(), ec.message());
                continue;
            }

            if (std::filesystem::is_directory(status)) {
                auto canonical = std::filesystem::canonical(child.path(), ec);
                if (ec) {
                    getLogger()->debug("Skipping unresolvable directory {}", child.path().string());
                    continue;
                }
                if (!visited.insert(canonical).second) {
                    getLogger()->warn("Skipping already visited directory {} (symlink cycle)",
                                      child.path().string());
                    continue;
                }
                // An unreadable subdirectory is logged and does not abort the walk
                (void)walkDirectory(child.path(), visited, entries);
            } else if (std::filesystem::is_regular_file(status)) {
                auto size = child.file_size(ec);
                entries.push_back(SourceEntry{child.path(), ec ? 0 : size});
            }
        }
        return true;
    }

    void stageObject(const SourceEntry& entry,
                     const std::filesystem::path& workDir,
                     StageResult& result) {
        auto sequenceIndex = nextSequenceIndex_;
        auto stagedPath = workDir / sequenceFileName(STAGED_FILE_PREFIX, sequenceIndex);

        // Never replace an existing file: the source may not be readable twice
        std::error_code ec;
        bool occupied = std::filesystem::exists(stagedPath, ec) || ec;
        if (occupied && !ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        if (!occupied) {
            std::filesystem::copy_file(entry.path, stagedPath,
                                       std::filesystem::copy_options::none, ec);
        }
        if (ec) {
            getLogger()->warn("Failed to stage {}: {}", entry.path.string(), ec.message());
            if (!occupied) {
                std::error_code removeEc;
                std::filesystem::remove(stagedPath, removeEc);
            }

            result.skipped.push_back(TransferOutcome::skipped(
                entry.path, "copy failed: " + ec.message()));
            ++result.counts.skipped;
            return;
        }

        auto byteSize = std::filesystem::file_size(stagedPath, ec);
        result.objects.push_back(StagedObject{
            .sourcePath = entry.path,
            .stagedPath = stagedPath,
            .sequenceIndex = sequenceIndex,
            .byteSize = ec ? entry.size : byteSize
        });
        ++result.counts.staged;
        ++nextSequenceIndex_;

        getLogger()->debug("Staged {} -> {}", entry.path.string(), stagedPath.filename().string());
    }
};

// Public interface implementation

DicomStager::DicomStager()
    : impl_(std::make_unique<Impl>()) {
}

DicomStager::~DicomStager() = default;

DicomStager::DicomStager(DicomStager&&) noexcept = default;
DicomStager& DicomStager::operator=(DicomStager&&) noexcept = default;

std::expected<std::vector<SourceEntry>, TransferErrorInfo>
DicomStager::discover(const std::filesystem::path& sourceRoot) const {
    return impl_->discover(sourceRoot);
}

std::expected<StageResult, TransferErrorInfo> DicomStager::stage(
    const std::filesystem::path& sourceRoot,
    const std::filesystem::path& workDir,
    const ProgressSink& progress,
    const CancellationToken* cancel
) {
    return impl_->stage(sourceRoot, workDir, progress, cancel);
}

} // namespace dicom_transfer::services
