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
 * @file pacs_backend.hpp
 * @brief Destination that sends staged objects to a PACS with C-STORE
 * @details Opens a single association for the whole batch and stores the
 *          objects in sequence order. Only an explicit success status counts
 *          as Accepted; any other status, and any request that exceeds the
 *          per-call timeout, is recorded as Rejected and the batch continues.
 *          If the association cannot be negotiated the dispatch fails before
 *          any store is attempted.
 *
 * ## Thread Safety
 * - One dispatch() at a time per instance
 * - The progress callback is invoked on the dispatching thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/pacs_config.hpp"
#include "services/transfer/destination_backend.hpp"
#include "services/transfer/store_association.hpp"

#include <memory>

namespace dicom_transfer::services {

/**
 * @brief PACS destination backend
 *
 * @example
 * @code
 * PacsServerConfig config;
 * config.hostname = "192.168.1.100";
 * config.calledAeTitle = "PACS_SERVER";
 *
 * PacsBackend backend(config);
 * CancellationToken cancel;
 * auto result = backend.dispatch(staged, nullptr, cancel);
 * if (!result) {
 *     std::cerr << result.error().toString() << "\n";
 * }
 * @endcode
 */
class PacsBackend : public IDestinationBackend {
public:
    /**
     * @param config Remote endpoint; dimseTimeout bounds each store
     * @param factory Association provider; DCMTK when null
     */
    explicit PacsBackend(PacsServerConfig config,
                         std::shared_ptr<IStoreAssociationFactory> factory = nullptr);

    [[nodiscard]] std::expected<DispatchResult, TransferErrorInfo>
    dispatch(const std::vector<StagedObject>& objects,
             const ProgressSink& progress,
             const CancellationToken& cancel) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "pacs"; }

    [[nodiscard]] const PacsServerConfig& config() const noexcept { return config_; }

private:
    PacsServerConfig config_;
    std::shared_ptr<IStoreAssociationFactory> factory_;
};

} // namespace dicom_transfer::services
