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
 * @file destination_backend.hpp
 * @brief Abstract dispatch capability shared by all transfer destinations
 * @details A destination receives the staged objects of a job in sequence
 *          order and reports one TransferOutcome per object it attempted.
 *          The destination set is closed (folder or PACS); the backend for
 *          a DestinationConfig is selected by makeDestinationBackend().
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/transfer/transfer_types.hpp"

#include <expected>
#include <memory>
#include <string_view>
#include <vector>

namespace dicom_transfer::services {

class IStoreAssociationFactory;

/**
 * @brief Abstract interface for transfer destinations
 */
class IDestinationBackend {
public:
    virtual ~IDestinationBackend() = default;

    /**
     * @brief Deliver staged objects to the destination
     *
     * Objects are handled in ascending sequence order. Per-object failures
     * are reported as Rejected outcomes; only destination-wide failures
     * (uncreatable folder, association refused) return an error. The
     * cancellation token is checked before each object.
     *
     * @param objects Staged objects of the job
     * @param progress Optional progress sink
     * @param cancel Cancellation token
     * @return Per-object outcomes, or a destination-wide error
     */
    [[nodiscard]] virtual std::expected<DispatchResult, TransferErrorInfo>
    dispatch(const std::vector<StagedObject>& objects,
             const ProgressSink& progress,
             const CancellationToken& cancel) = 0;

    /**
     * @brief Short destination name used in logs
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Create the backend matching a destination configuration
 *
 * @param destination Folder or PACS configuration
 * @param associationFactory Association provider for PACS destinations;
 *        the DCMTK implementation is used when null
 */
[[nodiscard]] std::unique_ptr<IDestinationBackend>
makeDestinationBackend(const DestinationConfig& destination,
                       std::shared_ptr<IStoreAssociationFactory> associationFactory = nullptr);

/**
 * @brief Objects sorted by ascending sequence index
 */
[[nodiscard]] std::vector<const StagedObject*>
inSequenceOrder(const std::vector<StagedObject>& objects);

} // namespace dicom_transfer::services
