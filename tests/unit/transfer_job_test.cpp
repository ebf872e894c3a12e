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

#include "services/transfer/transfer_job.hpp"
#include "../test_utils/dicom_file_factory.hpp"
#include "../test_utils/fake_store_association.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <vector>

using namespace dicom_transfer::services;
using namespace dicom_transfer::test_utils;

class TransferJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = root / "media";
        staging = root / "staging";
        std::filesystem::create_directories(source);
        std::filesystem::create_directories(staging);
        factory = std::make_shared<FakeStoreAssociationFactory>();
    }

    void writeSource(int dicomCount, int otherCount = 0) {
        for (int i = 0; i < dicomCount; ++i) {
            writeDicomFile(source / ("IM" + std::to_string(i)), 64, static_cast<uint8_t>(i));
        }
        for (int i = 0; i < otherCount; ++i) {
            writeNonDicomFile(source / ("README" + std::to_string(i) + ".txt"));
        }
    }

    std::unique_ptr<TransferJob> makeJob(DestinationConfig destination) {
        auto job = std::make_unique<TransferJob>(source, std::move(destination),
                                                 TransferJobOptions{staging});
        job->setAssociationFactory(factory);
        return job;
    }

    bool stagingIsEmpty() const {
        return std::filesystem::is_empty(staging);
    }

    TempDirectory root{"transfer_job_test"};
    std::filesystem::path source;
    std::filesystem::path staging;
    std::shared_ptr<FakeStoreAssociationFactory> factory;
};

TEST_F(TransferJobTest, InitialStateIsIdle) {
    auto job = makeJob(FolderDestination{root / "out"});
    EXPECT_EQ(job->state(), JobState::Idle);
    EXPECT_TRUE(job->workingDirectory().empty());
    EXPECT_EQ(job->counters().found, 0);
}

TEST_F(TransferJobTest, FolderTransferCompletes) {
    writeSource(3, 2);
    auto job = makeJob(FolderDestination{root / "out"});

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Done);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.filesFound, 5);
    EXPECT_EQ(result.filesStaged, 3);
    EXPECT_EQ(result.filesDispatched, 3);
    EXPECT_EQ(result.filesFailed, 0);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(listFiles(root / "out").size(), 3u);
    EXPECT_EQ(job->state(), JobState::Done);
}

TEST_F(TransferJobTest, WorkingDirectoryIsUniqueAndRemoved) {
    writeSource(1);
    auto job = makeJob(FolderDestination{root / "out"});

    std::filesystem::path seenWorkDir;
    auto result = job->run([&](const ProgressEvent& e) {
        if (e.phase == JobState::Scanning && seenWorkDir.empty()) {
            seenWorkDir = job->workingDirectory();
        }
    });
    ASSERT_TRUE(result.succeeded());

    ASSERT_FALSE(seenWorkDir.empty());
    EXPECT_EQ(seenWorkDir.parent_path(), staging);
    EXPECT_EQ(seenWorkDir.filename().string().rfind(TransferJob::WORK_DIR_PREFIX, 0), 0u);
    EXPECT_FALSE(std::filesystem::exists(seenWorkDir));
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, PhasesFollowStateMachine) {
    writeSource(2);
    auto job = makeJob(FolderDestination{root / "out"});

    std::vector<JobState> phases;
    auto result = job->run([&phases](const ProgressEvent& e) {
        if (phases.empty() || phases.back() != e.phase) {
            phases.push_back(e.phase);
        }
    });
    ASSERT_TRUE(result.succeeded());

    std::vector<JobState> expected{
        JobState::Scanning, JobState::Dispatching, JobState::Cleaning};
    EXPECT_EQ(phases, expected);
}

TEST_F(TransferJobTest, ZeroObjectsIsDoneWithoutDispatch) {
    writeSource(0, 3);
    auto job = makeJob(fakePacsConfig());

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Done);
    EXPECT_EQ(result.filesFound, 3);
    EXPECT_EQ(result.filesStaged, 0);
    EXPECT_EQ(result.filesDispatched, 0);
    EXPECT_EQ(factory->state().associateCalls, 0);
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, EmptySourceIsDone) {
    auto job = makeJob(FolderDestination{root / "out"});
    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Done);
    EXPECT_EQ(result.filesFound, 0);
}

TEST_F(TransferJobTest, InvalidFolderConfigFailsBeforeScanning) {
    writeSource(2);
    auto job = makeJob(FolderDestination{});

    bool sawProgress = false;
    auto result = job->run([&sawProgress](const ProgressEvent&) { sawProgress = true; });
    EXPECT_EQ(result.finalState, JobState::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, TransferError::ConfigError);
    EXPECT_EQ(result.error->phase, JobState::Idle);
    EXPECT_FALSE(sawProgress);
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, InvalidPacsConfigFailsBeforeScanning) {
    writeSource(2);
    PacsServerConfig config = fakePacsConfig();
    config.port = 0;
    auto job = makeJob(config);

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, TransferError::ConfigError);
    EXPECT_EQ(factory->state().associateCalls, 0);
    EXPECT_EQ(result.filesFound, 0);
}

TEST_F(TransferJobTest, MissingSourceFailsInScanningAndCleansUp) {
    std::filesystem::remove_all(source);
    auto job = makeJob(FolderDestination{root / "out"});

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, TransferError::IoError);
    EXPECT_EQ(result.error->phase, JobState::Scanning);
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, AssociationFailureFailsInDispatchingAndCleansUp) {
    writeSource(3);
    factory->refuseAssociations();
    auto job = makeJob(fakePacsConfig());

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, TransferError::AssociationError);
    EXPECT_EQ(result.error->phase, JobState::Dispatching);
    EXPECT_EQ(result.filesStaged, 3);
    EXPECT_EQ(result.filesDispatched, 0);
    EXPECT_TRUE(factory->state().storedFiles.empty());
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, RejectedObjectsCountAsFailed) {
    writeSource(4);
    factory->scriptFailure(1, StoreFailure::Timeout, "timeout");
    factory->scriptStatus(3, 0xA700);
    auto job = makeJob(fakePacsConfig());

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Done);
    EXPECT_EQ(result.filesDispatched, 2);
    EXPECT_EQ(result.filesFailed, 2);
    ASSERT_EQ(result.outcomes.size(), 4u);
    EXPECT_EQ(result.outcomes[1].reason, "timeout");
}

TEST_F(TransferJobTest, CancelDuringDispatchEndsCancelledAndCleansUp) {
    writeSource(5);
    auto job = makeJob(fakePacsConfig());
    factory->state().afterStore = [&job](std::size_t index) {
        if (index == 1) {
            job->cancel();
        }
    };

    auto result = job->run();
    EXPECT_EQ(result.finalState, JobState::Cancelled);
    EXPECT_EQ(result.outcomes.size(), 2u);
    EXPECT_EQ(result.filesDispatched, 2);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, CancelDuringScanningEndsCancelled) {
    writeSource(5);
    auto job = makeJob(FolderDestination{root / "out"});

    auto result = job->run([&job](const ProgressEvent& e) {
        if (e.phase == JobState::Scanning && e.found == 1) {
            job->cancel();
        }
    });
    EXPECT_EQ(result.finalState, JobState::Cancelled);
    EXPECT_EQ(result.filesStaged, 1);
    EXPECT_FALSE(std::filesystem::exists(root / "out"));
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(TransferJobTest, CountersTrackProgress) {
    writeSource(3, 1);
    auto job = makeJob(FolderDestination{root / "out"});

    auto result = job->run();
    ASSERT_TRUE(result.succeeded());
    auto counters = job->counters();
    EXPECT_EQ(counters.found, 4);
    EXPECT_EQ(counters.staged, 3);
    EXPECT_EQ(counters.dispatched, 3);
    EXPECT_EQ(counters.failed, 0);
}

TEST_F(TransferJobTest, SecondRunIsRefused) {
    writeSource(1);
    auto job = makeJob(FolderDestination{root / "out"});
    ASSERT_TRUE(job->run().succeeded());

    auto again = job->run();
    EXPECT_EQ(again.finalState, JobState::Failed);
    ASSERT_TRUE(again.error.has_value());
    EXPECT_EQ(again.error->code, TransferError::ConfigError);
    EXPECT_EQ(job->state(), JobState::Done);
}

TEST_F(TransferJobTest, CancellationTokenIsShared) {
    auto job = makeJob(FolderDestination{root / "out"});
    auto token = job->cancellationToken();
    EXPECT_FALSE(token.isCancelled());
    job->cancel();
    EXPECT_TRUE(token.isCancelled());
}

TEST(JobStateTest, TerminalStates) {
    EXPECT_TRUE(isTerminal(JobState::Done));
    EXPECT_TRUE(isTerminal(JobState::Failed));
    EXPECT_TRUE(isTerminal(JobState::Cancelled));
    EXPECT_FALSE(isTerminal(JobState::Idle));
    EXPECT_FALSE(isTerminal(JobState::Dispatching));
    EXPECT_FALSE(isTerminal(JobState::Cleaning));
}
