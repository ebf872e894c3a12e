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

#pragma once

/**
 * @file fake_store_association.hpp
 * @brief Scripted stand-in for the C-STORE association seam
 *
 * The factory hands out associations that answer store() from a shared
 * script indexed by call order; unscripted calls succeed. A scripted
 * Timeout or NetworkError leaves the association Failed, the way the
 * DCMTK implementation aborts a session after a broken exchange.
 */

#include "services/transfer/store_association.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace dicom_transfer::test_utils {

using services::AssociationState;
using services::StoreFailure;
using services::StoreFailureInfo;
using services::StoreResponse;

/**
 * @brief State shared between a fake factory and its associations
 */
struct FakeStoreState {
    /// Number of associate() calls that must fail before one succeeds;
    /// a negative value fails every call
    int failAssociations = 0;

    /// Error returned by a failing associate()
    services::PacsErrorInfo associationError{
        services::PacsError::AssociationRejected, "called AE title not recognized"};

    /// Scripted results keyed by zero-based store call index
    std::map<std::size_t, std::expected<StoreResponse, StoreFailureInfo>> script;

    /// Invoked after each store with the zero-based call index
    std::function<void(std::size_t)> afterStore;

    // Observations
    int associateCalls = 0;
    int releaseCalls = 0;
    int abortCalls = 0;
    std::vector<std::filesystem::path> storedFiles;

    std::mutex mutex;
};

class FakeStoreAssociation : public services::IStoreAssociation {
public:
    explicit FakeStoreAssociation(std::shared_ptr<FakeStoreState> state)
        : state_(std::move(state)) {
    }

    std::expected<StoreResponse, StoreFailureInfo>
    store(const std::filesystem::path& file, std::chrono::seconds /*timeout*/) override {
        std::size_t index = 0;
        std::optional<std::expected<StoreResponse, StoreFailureInfo>> scripted;
        {
            std::lock_guard lock(state_->mutex);
            index = state_->storedFiles.size();
            state_->storedFiles.push_back(file);
            if (auto it = state_->script.find(index); it != state_->script.end()) {
                scripted = it->second;
            }
        }

        std::expected<StoreResponse, StoreFailureInfo> result = StoreResponse{};
        if (scripted) {
            result = *scripted;
        }
        if (!result &&
            (result.error().code == StoreFailure::Timeout ||
             result.error().code == StoreFailure::NetworkError)) {
            associationState_ = AssociationState::Failed;
        }

        if (state_->afterStore) {
            state_->afterStore(index);
        }
        return result;
    }

    void release() override {
        if (associationState_ != AssociationState::Open) {
            return;
        }
        std::lock_guard lock(state_->mutex);
        ++state_->releaseCalls;
        associationState_ = AssociationState::Closed;
    }

    void abort() override {
        std::lock_guard lock(state_->mutex);
        ++state_->abortCalls;
        associationState_ = AssociationState::Failed;
    }

    AssociationState state() const noexcept override { return associationState_; }

private:
    std::shared_ptr<FakeStoreState> state_;
    AssociationState associationState_ = AssociationState::Open;
};

class FakeStoreAssociationFactory : public services::IStoreAssociationFactory {
public:
    FakeStoreAssociationFactory()
        : state_(std::make_shared<FakeStoreState>()) {
    }

    std::expected<std::unique_ptr<services::IStoreAssociation>, services::PacsErrorInfo>
    associate(const services::PacsServerConfig& /*config*/) override {
        std::lock_guard lock(state_->mutex);
        ++state_->associateCalls;
        if (state_->failAssociations != 0) {
            if (state_->failAssociations > 0) {
                --state_->failAssociations;
            }
            return std::unexpected(state_->associationError);
        }
        return std::make_unique<FakeStoreAssociation>(state_);
    }

    FakeStoreState& state() { return *state_; }

    /// Fail every association attempt from now on
    void refuseAssociations() { state_->failAssociations = -1; }

    void scriptStatus(std::size_t callIndex, uint16_t status, std::string comment = {}) {
        state_->script[callIndex] = StoreResponse{status, std::move(comment)};
    }

    void scriptFailure(std::size_t callIndex, StoreFailure code, std::string message) {
        state_->script[callIndex] =
            std::unexpected(StoreFailureInfo{code, std::move(message)});
    }

private:
    std::shared_ptr<FakeStoreState> state_;
};

/**
 * @brief Valid endpoint for tests that never touch the network
 */
inline services::PacsServerConfig fakePacsConfig() {
    services::PacsServerConfig config;
    config.hostname = "pacs.test";
    config.port = 11112;
    config.calledAeTitle = "TEST_PACS";
    config.dimseTimeout = std::chrono::seconds(1);
    return config;
}

} // namespace dicom_transfer::test_utils
