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

#include "services/transfer/transfer_types.hpp"

#include <string>

using namespace dicom_transfer::services;

TEST(TransferTypesTest, SequenceFileNameIsZeroPadded) {
    EXPECT_EQ(sequenceFileName("object", 0), "object_000000.dcm");
    EXPECT_EQ(sequenceFileName("export", 42), "export_000042.dcm");
    EXPECT_EQ(sequenceFileName("export", 999999), "export_999999.dcm");
}

TEST(TransferTypesTest, SequenceFileNameBeyondSixDigits) {
    EXPECT_EQ(sequenceFileName("object", 1234567), "object_1234567.dcm");
}

TEST(TransferTypesTest, ErrorInfoToStringNamesCodeAndPhase) {
    TransferErrorInfo error{
        TransferError::AssociationError,
        "called AE title not recognized",
        JobState::Dispatching
    };
    auto str = error.toString();
    EXPECT_NE(str.find("AssociationError"), std::string::npos);
    EXPECT_NE(str.find("called AE title not recognized"), std::string::npos);
    EXPECT_NE(str.find("Dispatching"), std::string::npos);
}

TEST(TransferTypesTest, OutcomeFactoriesCarryObjectIdentity) {
    StagedObject object{
        .sourcePath = "/media/IM0",
        .stagedPath = "/tmp/work/object_000004.dcm",
        .sequenceIndex = 4,
        .byteSize = 1024
    };

    auto accepted = TransferOutcome::accepted(object, uint16_t{0x0000});
    EXPECT_TRUE(accepted.isAccepted());
    EXPECT_EQ(accepted.sequenceIndex, 4u);
    EXPECT_EQ(accepted.path, object.stagedPath);
    EXPECT_TRUE(accepted.reason.empty());

    auto rejected = TransferOutcome::rejected(object, "timeout");
    EXPECT_FALSE(rejected.isAccepted());
    EXPECT_EQ(rejected.kind, OutcomeKind::Rejected);
    EXPECT_EQ(rejected.reason, "timeout");
    EXPECT_FALSE(rejected.dimseStatus.has_value());

    auto skipped = TransferOutcome::skipped("/media/IM1", "copy failed: I/O error");
    EXPECT_EQ(skipped.kind, OutcomeKind::Skipped);
    EXPECT_FALSE(skipped.sequenceIndex.has_value());
}

TEST(TransferTypesTest, DestinationValidation) {
    EXPECT_FALSE(isValid(DestinationConfig{FolderDestination{}}));
    EXPECT_TRUE(isValid(DestinationConfig{FolderDestination{"/mnt/share"}}));

    PacsServerConfig pacs;
    EXPECT_FALSE(isValid(DestinationConfig{pacs}));
    pacs.hostname = "pacs.local";
    pacs.calledAeTitle = "ARCHIVE";
    EXPECT_TRUE(isValid(DestinationConfig{pacs}));

    EXPECT_EQ(destinationKind(DestinationConfig{FolderDestination{}}), "folder");
    EXPECT_EQ(destinationKind(DestinationConfig{pacs}), "pacs");
}

TEST(TransferTypesTest, DispatchResultCounts) {
    StagedObject object;
    DispatchResult result;
    result.outcomes.push_back(TransferOutcome::accepted(object));
    result.outcomes.push_back(TransferOutcome::rejected(object, "status 0xA700"));
    result.outcomes.push_back(TransferOutcome::accepted(object));

    EXPECT_EQ(result.acceptedCount(), 2);
    EXPECT_EQ(result.rejectedCount(), 1);
}

TEST(TransferTypesTest, PercentCompleteUsesPhaseCounter) {
    ProgressEvent scanning{.phase = JobState::Scanning, .found = 5, .processed = 1, .total = 10};
    EXPECT_FLOAT_EQ(scanning.percentComplete(), 50.0f);

    ProgressEvent dispatching{.phase = JobState::Dispatching, .found = 4, .processed = 1, .total = 4};
    EXPECT_FLOAT_EQ(dispatching.percentComplete(), 25.0f);

    ProgressEvent empty;
    EXPECT_FLOAT_EQ(empty.percentComplete(), 0.0f);
}

TEST(TransferTypesTest, CancellationTokenCopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.isCancelled());

    token.requestCancel();
    EXPECT_TRUE(copy.isCancelled());
}

TEST(TransferTypesTest, JobResultSucceededOnlyWhenDone) {
    JobResult result;
    result.finalState = JobState::Done;
    EXPECT_TRUE(result.succeeded());
    result.finalState = JobState::Cancelled;
    EXPECT_FALSE(result.succeeded());
    result.finalState = JobState::Failed;
    EXPECT_FALSE(result.succeeded());
}
