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
 * @file store_association.hpp
 * @brief Network session used by the PACS backend to send C-STORE requests
 * @details Separates the dispatch loop from the DICOM toolkit. A factory
 *          negotiates one association; the association then stores files
 *          one at a time, each bounded by a timeout, until it is released.
 *          DcmtkStoreAssociationFactory is the production implementation.
 *
 * ## Thread Safety
 * - An association is used by one thread at a time
 * - Factories are stateless and may be shared
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/dicom_echo_scu.hpp"
#include "services/pacs_config.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace dicom_transfer::services {

/**
 * @brief Lifecycle of an association
 */
enum class AssociationState {
    Idle,
    Negotiating,
    Open,
    Closing,
    Closed,
    Failed
};

[[nodiscard]] std::string_view toString(AssociationState state) noexcept;

/// DIMSE success status
inline constexpr uint16_t DIMSE_STATUS_SUCCESS = 0x0000;

/**
 * @brief Response to a C-STORE request
 */
struct StoreResponse {
    /// DIMSE status returned by the server
    uint16_t status = DIMSE_STATUS_SUCCESS;

    /// Error comment from the status detail, if the server sent one
    std::string errorComment;

    [[nodiscard]] bool isSuccess() const noexcept { return status == DIMSE_STATUS_SUCCESS; }
};

/**
 * @brief Reasons a C-STORE produced no server response
 */
enum class StoreFailure {
    Timeout,                ///< No response within the per-call bound
    NoPresentationContext,  ///< The server did not accept the object's SOP class
    InvalidObject,          ///< The staged file could not be read as DICOM
    NetworkError            ///< The connection failed during the exchange
};

struct StoreFailureInfo {
    StoreFailure code;
    std::string message;
};

/**
 * @brief Open association able to send C-STORE requests
 */
class IStoreAssociation {
public:
    virtual ~IStoreAssociation() = default;

    /**
     * @brief Send one file with C-STORE
     * @param file DICOM file to send
     * @param timeout Bound for the request/response exchange
     * @return Server response, or the reason no response was obtained
     */
    [[nodiscard]] virtual std::expected<StoreResponse, StoreFailureInfo>
    store(const std::filesystem::path& file, std::chrono::seconds timeout) = 0;

    /**
     * @brief Release gracefully, aborting if the release fails
     */
    virtual void release() = 0;

    /**
     * @brief Abort without release negotiation
     */
    virtual void abort() = 0;

    [[nodiscard]] virtual AssociationState state() const noexcept = 0;
};

/**
 * @brief Negotiates store associations
 */
class IStoreAssociationFactory {
public:
    virtual ~IStoreAssociationFactory() = default;

    /**
     * @brief Open an association proposing the supported storage classes
     * @param config Remote endpoint
     * @return Open association, or the negotiation failure
     */
    [[nodiscard]] virtual std::expected<std::unique_ptr<IStoreAssociation>, PacsErrorInfo>
    associate(const PacsServerConfig& config) = 0;
};

/**
 * @brief DCMTK-based association factory
 *
 * Proposes one presentation context per storage SOP class that DCMTK lists
 * for storage SCUs, each with the uncompressed transfer syntaxes.
 *
 * DCMTK keeps the TCP connect timeout in a process-wide setting, so
 * association requests from concurrent jobs are serialized while they
 * connect and negotiate. Stores on open associations run in parallel.
 */
class DcmtkStoreAssociationFactory : public IStoreAssociationFactory {
public:
    [[nodiscard]] std::expected<std::unique_ptr<IStoreAssociation>, PacsErrorInfo>
    associate(const PacsServerConfig& config) override;
};

} // namespace dicom_transfer::services
