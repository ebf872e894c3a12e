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
 * @file transfer_job.hpp
 * @brief Orchestrates staging, dispatch and cleanup of one transfer
 * @details A TransferJob copies the DICOM objects found under a source root
 *          into a private working directory, hands them to the backend
 *          selected by its DestinationConfig and finally removes the working
 *          directory. Cleanup runs on every path out of the job, including
 *          failure and cancellation.
 *
 * ## State machine
 * Idle -> Scanning -> Staged -> Dispatching -> Cleaning -> Done
 *
 * ## Thread Safety
 * - run() is called once, from a single thread
 * - cancel(), state() and counters() may be called from any thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/transfer/transfer_types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>

namespace dicom_transfer::services {

class IStoreAssociationFactory;

/**
 * @brief Construction options of a transfer job
 */
struct TransferJobOptions {
    /// Directory under which the working directory is created;
    /// the system temp directory when empty
    std::filesystem::path stagingParent;
};

/**
 * @brief Snapshot of the live progress counters
 */
struct JobCounters {
    int32_t found = 0;
    int32_t staged = 0;
    int32_t dispatched = 0;
    int32_t failed = 0;
};

/**
 * @brief One source-to-destination transfer
 *
 * @example
 * @code
 * TransferJob job("/media/cdrom", FolderDestination{"/data/export"});
 * auto result = job.run([](const ProgressEvent& e) {
 *     std::cout << toString(e.phase) << " " << e.percentComplete() << "%\n";
 * });
 * std::cout << result.filesDispatched << " exported\n";
 * @endcode
 */
class TransferJob {
public:
    /// Prefix of the working directory name
    static constexpr const char* WORK_DIR_PREFIX = "dicom_transfer_";

    TransferJob(std::filesystem::path sourceRoot,
                DestinationConfig destination,
                TransferJobOptions options = {});
    ~TransferJob();

    // Non-copyable, movable
    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;
    TransferJob(TransferJob&&) noexcept;
    TransferJob& operator=(TransferJob&&) noexcept;

    /**
     * @brief Replace the association provider used for PACS destinations
     *
     * Must be called before run().
     */
    void setAssociationFactory(std::shared_ptr<IStoreAssociationFactory> factory);

    /**
     * @brief Run the job to completion
     *
     * @param progress Optional sink, invoked on the calling thread
     * @return Aggregated result; finalState is Done, Failed or Cancelled
     */
    [[nodiscard]] JobResult run(const ProgressSink& progress = nullptr);

    /**
     * @brief Request cancellation
     *
     * Takes effect before the next file or object. Cleanup still runs.
     */
    void cancel() noexcept;

    /**
     * @brief Token shared with the running phase
     */
    [[nodiscard]] CancellationToken cancellationToken() const;

    /**
     * @brief Current phase
     */
    [[nodiscard]] JobState state() const noexcept;

    /**
     * @brief Live counters
     */
    [[nodiscard]] JobCounters counters() const noexcept;

    /**
     * @brief Working directory of the current run; empty before Scanning
     */
    [[nodiscard]] std::filesystem::path workingDirectory() const;

    [[nodiscard]] const std::filesystem::path& sourceRoot() const noexcept;
    [[nodiscard]] const DestinationConfig& destination() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_transfer::services
