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
 * @file transfer_worker.hpp
 * @brief Runs a TransferJob on a dedicated background thread
 * @details TransferWorker owns one std::jthread per job. The job's progress
 *          events are pushed into a ProgressChannel that the caller drains
 *          from its own thread; the final JobResult is delivered through a
 *          std::future. Requesting a stop on the worker cancels the job, and
 *          destroying the worker waits for the job (and its cleanup) to end.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/transfer/transfer_job.hpp"
#include "services/transfer/transfer_types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace dicom_transfer::services {

/**
 * @brief Thread-safe FIFO of progress events
 *
 * The producer pushes events and closes the channel when the job ends.
 * Consumers pop until waitPop() returns std::nullopt.
 */
class ProgressChannel {
public:
    /**
     * @brief Append an event; ignored after close()
     */
    void push(ProgressEvent event);

    /**
     * @brief Mark the end of the stream and wake all waiters
     */
    void close();

    /**
     * @brief Pop without blocking
     */
    [[nodiscard]] std::optional<ProgressEvent> tryPop();

    /**
     * @brief Pop, blocking until an event arrives or the channel is closed
     * @return Event, or std::nullopt once closed and drained
     */
    [[nodiscard]] std::optional<ProgressEvent> waitPop();

    /**
     * @brief Pop, blocking at most @p timeout
     */
    [[nodiscard]] std::optional<ProgressEvent> waitPopFor(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isClosed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
};

/**
 * @brief Background executor for one transfer job
 *
 * @example
 * @code
 * TransferWorker worker(std::make_unique<TransferJob>(source, destination));
 * auto future = worker.start();
 * while (auto event = worker.progress().waitPop()) {
 *     std::cout << event->percentComplete() << "%\n";
 * }
 * JobResult result = future.get();
 * @endcode
 */
class TransferWorker {
public:
    explicit TransferWorker(std::unique_ptr<TransferJob> job);

    /**
     * @brief Stops the thread (cancelling the job) and joins it
     */
    ~TransferWorker();

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    /**
     * @brief Launch the job thread
     *
     * @param sink Optional extra sink, invoked on the worker thread
     * @return Future of the job result; invalid if already started
     */
    [[nodiscard]] std::future<JobResult> start(ProgressSink sink = nullptr);

    /**
     * @brief Request cancellation of the running job
     */
    void cancel() noexcept;

    /**
     * @brief Events published by the running job
     */
    [[nodiscard]] ProgressChannel& progress() noexcept { return channel_; }

    [[nodiscard]] const TransferJob& job() const noexcept { return *job_; }

    [[nodiscard]] bool isStarted() const noexcept { return thread_.joinable(); }

private:
    std::unique_ptr<TransferJob> job_;
    ProgressChannel channel_;
    std::jthread thread_;
};

} // namespace dicom_transfer::services
