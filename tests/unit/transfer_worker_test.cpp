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

#include <gtest/gtest.h>

#include "services/transfer/transfer_worker.hpp"
#include "../test_utils/dicom_file_factory.hpp"
#include "../test_utils/fake_store_association.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <latch>
#include <memory>
#include <thread>
#include <vector>

using namespace dicom_transfer::services;
using namespace dicom_transfer::test_utils;

namespace {

ProgressEvent makeEvent(int32_t processed) {
    return ProgressEvent{
        .phase = JobState::Dispatching,
        .found = 10,
        .processed = processed,
        .total = 10,
        .currentFileName = "object_" + std::to_string(processed)
    };
}

} // anonymous namespace

TEST(ProgressChannelTest, PreservesOrder) {
    ProgressChannel channel;
    channel.push(makeEvent(1));
    channel.push(makeEvent(2));
    channel.push(makeEvent(3));

    EXPECT_EQ(channel.tryPop()->processed, 1);
    EXPECT_EQ(channel.tryPop()->processed, 2);
    EXPECT_EQ(channel.tryPop()->processed, 3);
    EXPECT_FALSE(channel.tryPop().has_value());
}

TEST(ProgressChannelTest, CloseDrainsThenEnds) {
    ProgressChannel channel;
    channel.push(makeEvent(1));
    channel.close();
    channel.push(makeEvent(2));  // ignored after close

    EXPECT_TRUE(channel.isClosed());
    auto first = channel.waitPop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->processed, 1);
    EXPECT_FALSE(channel.waitPop().has_value());
}

TEST(ProgressChannelTest, WaitPopForTimesOutWhenEmpty) {
    ProgressChannel channel;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.waitPopFor(std::chrono::milliseconds(20)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(15));
}

TEST(ProgressChannelTest, ConcurrentProducerAndConsumer) {
    constexpr int kEvents = 500;
    ProgressChannel channel;
    std::latch startLatch(2);

    std::thread producer([&] {
        startLatch.arrive_and_wait();
        for (int i = 1; i <= kEvents; ++i) {
            channel.push(makeEvent(i));
        }
        channel.close();
    });

    startLatch.arrive_and_wait();
    int received = 0;
    int last = 0;
    while (auto event = channel.waitPop()) {
        EXPECT_GT(event->processed, last);
        last = event->processed;
        ++received;
    }
    producer.join();

    EXPECT_EQ(received, kEvents);
}

class TransferWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = root / "media";
        for (int i = 0; i < 5; ++i) {
            writeDicomFile(source / ("IM" + std::to_string(i)), 64, static_cast<uint8_t>(i));
        }
        factory = std::make_shared<FakeStoreAssociationFactory>();
    }

    std::unique_ptr<TransferJob> makeJob(DestinationConfig destination) {
        auto job = std::make_unique<TransferJob>(source, std::move(destination),
                                                 TransferJobOptions{root / "staging"});
        job->setAssociationFactory(factory);
        return job;
    }

    TempDirectory root{"transfer_worker_test"};
    std::filesystem::path source;
    std::shared_ptr<FakeStoreAssociationFactory> factory;
};

TEST_F(TransferWorkerTest, RunsJobOnBackgroundThread) {
    auto callerThread = std::this_thread::get_id();
    std::atomic<bool> sinkOnOtherThread{true};

    TransferWorker worker(makeJob(FolderDestination{root / "out"}));
    auto future = worker.start([&](const ProgressEvent&) {
        if (std::this_thread::get_id() == callerThread) {
            sinkOnOtherThread = false;
        }
    });
    ASSERT_TRUE(future.valid());

    std::vector<ProgressEvent> events;
    while (auto event = worker.progress().waitPop()) {
        events.push_back(*event);
    }

    auto result = future.get();
    EXPECT_EQ(result.finalState, JobState::Done);
    EXPECT_EQ(result.filesDispatched, 5);
    EXPECT_TRUE(sinkOnOtherThread);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().phase, JobState::Scanning);
    EXPECT_EQ(events.back().phase, JobState::Cleaning);
}

TEST_F(TransferWorkerTest, SecondStartReturnsInvalidFuture) {
    TransferWorker worker(makeJob(FolderDestination{root / "out"}));
    auto first = worker.start();
    auto second = worker.start();
    EXPECT_TRUE(first.valid());
    EXPECT_FALSE(second.valid());
    first.get();
}

TEST_F(TransferWorkerTest, CancelFromCallerThread) {
    std::latch dispatchStarted(1);
    std::latch cancelSent(1);
    factory->state().afterStore = [&](std::size_t index) {
        if (index == 0) {
            dispatchStarted.count_down();
            cancelSent.wait();
        }
    };

    TransferWorker worker(makeJob(fakePacsConfig()));
    auto future = worker.start();

    dispatchStarted.wait();
    worker.cancel();
    cancelSent.count_down();

    auto result = future.get();
    EXPECT_EQ(result.finalState, JobState::Cancelled);
    EXPECT_EQ(result.outcomes.size(), 1u);
    EXPECT_TRUE(std::filesystem::is_empty(root / "staging"));
}

TEST_F(TransferWorkerTest, DestructionStopsRunningJob) {
    std::latch dispatchStarted(1);
    std::atomic<bool> released{false};
    factory->state().afterStore = [&](std::size_t index) {
        if (index == 0) {
            dispatchStarted.count_down();
        }
        // Hold the first store until the worker has requested a stop
        while (index == 0 && !released.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    };

    std::future<JobResult> future;
    std::thread releaser;
    {
        TransferWorker worker(makeJob(fakePacsConfig()));
        future = worker.start();
        dispatchStarted.wait();

        releaser = std::thread([&released] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            released = true;
        });
    }
    releaser.join();

    auto result = future.get();
    EXPECT_EQ(result.finalState, JobState::Cancelled);
    EXPECT_LT(result.outcomes.size(), 5u);
}
