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
 * @file dicom_stager.hpp
 * @brief Copies DICOM objects from slow source media into a working area
 * @details Walks a source tree once, classifies every regular file with
 *          DicomValidator and copies the valid ones verbatim into a private
 *          working directory as object_NNNNNN.dcm. Sequential whole-file
 *          reads keep optical drives from seeking; later phases only touch
 *          the local copies.
 *
 * ## Thread Safety
 * - A stager instance runs one stage() at a time
 * - The progress callback is invoked on the calling thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/transfer/transfer_types.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

namespace dicom_transfer::services {

/**
 * @brief Counters reported by a staging pass
 */
struct StageCounts {
    /// Regular files inspected
    int32_t totalScanned = 0;

    /// Files found during the walk (same as totalScanned)
    int32_t found = 0;

    /// Objects copied into the working directory
    int32_t staged = 0;

    /// Valid objects that could not be copied
    int32_t skipped = 0;
};

/**
 * @brief Result of a staging pass
 */
struct StageResult {
    /// Staged objects in ascending sequence order
    std::vector<StagedObject> objects;

    /// Skipped(reason) outcomes for valid files that failed to copy
    std::vector<TransferOutcome> skipped;

    StageCounts counts;

    /// Whether the pass stopped early on cancellation
    bool cancelled = false;
};

/**
 * @brief Source tree walker and local cache builder
 *
 * @example
 * @code
 * DicomStager stager;
 * auto result = stager.stage("/media/cdrom", workDir,
 *     [](const ProgressEvent& e) {
 *         std::cout << e.found << "/" << e.total << "\n";
 *     });
 * if (result) {
 *     std::cout << result->counts.staged << " objects staged\n";
 * }
 * @endcode
 */
class DicomStager {
public:
    /// Prefix of staged file names
    static constexpr const char* STAGED_FILE_PREFIX = "object";

    DicomStager();
    ~DicomStager();

    // Non-copyable, movable
    DicomStager(const DicomStager&) = delete;
    DicomStager& operator=(const DicomStager&) = delete;
    DicomStager(DicomStager&&) noexcept;
    DicomStager& operator=(DicomStager&&) noexcept;

    /**
     * @brief Enumerate regular files below a root
     *
     * Directory symlinks are followed; a directory whose canonical path was
     * already visited is skipped, so symlink cycles terminate. Entries are
     * returned in a stable (sorted per directory) order.
     *
     * @param sourceRoot Directory to walk
     * @return Discovered entries, or IoError if the root is not a directory
     */
    [[nodiscard]] std::expected<std::vector<SourceEntry>, TransferErrorInfo>
    discover(const std::filesystem::path& sourceRoot) const;

    /**
     * @brief Validate and copy every DICOM object below sourceRoot
     *
     * Per-file copy failures become Skipped outcomes; the walk continues.
     * Numbering starts after the highest object_N.dcm already in workDir,
     * and an existing file is never overwritten, so repeated passes into
     * one directory accumulate.
     *
     * @param sourceRoot Directory to walk
     * @param workDir Existing directory receiving object_NNNNNN.dcm files
     * @param progress Optional progress sink
     * @param cancel Optional cancellation token, checked between files
     * @return StageResult, or IoError if the root or workDir is unusable
     */
    [[nodiscard]] std::expected<StageResult, TransferErrorInfo>
    stage(const std::filesystem::path& sourceRoot,
          const std::filesystem::path& workDir,
          const ProgressSink& progress = nullptr,
          const CancellationToken* cancel = nullptr);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_transfer::services
