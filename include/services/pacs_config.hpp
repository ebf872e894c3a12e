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
 * @file pacs_config.hpp
 * @brief PACS endpoint configuration used by probing and C-STORE dispatch
 * @details Defines the PacsServerConfig struct containing DICOM network
 *          parameters: hostname, port, AE titles (local and remote) and the
 *          connection and per-request timeouts.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dicom_transfer::services {

/// Maximum length of an Application Entity title
inline constexpr std::size_t MAX_AE_TITLE_LENGTH = 16;

/**
 * @brief Configuration for a PACS/DICOM server
 *
 * Contains all necessary information to establish a connection
 * with a DICOM Application Entity (AE).
 */
struct PacsServerConfig {
    /// Default calling AE title of this client
    static constexpr const char* DEFAULT_CALLING_AE_TITLE = "DICOM_IMPORTER";

    /// Server hostname or IP address
    std::string hostname;

    /// DICOM port number (default: 104)
    uint16_t port = 104;

    /// Called AE Title (remote server's AE title)
    std::string calledAeTitle;

    /// Calling AE Title (this client's AE title)
    std::string callingAeTitle = DEFAULT_CALLING_AE_TITLE;

    /// Connection and association negotiation timeout
    std::chrono::seconds connectionTimeout{30};

    /// Upper bound for a single DIMSE request/response exchange
    std::chrono::seconds dimseTimeout{30};

    /// Maximum PDU size for network transmission
    uint32_t maxPduSize = 16384;

    /**
     * @brief Validate the configuration
     * @return true if all four endpoint fields are present and well-formed
     */
    [[nodiscard]] bool isValid() const noexcept {
        return !hostname.empty() &&
               !calledAeTitle.empty() &&
               !callingAeTitle.empty() &&
               calledAeTitle.length() <= MAX_AE_TITLE_LENGTH &&
               callingAeTitle.length() <= MAX_AE_TITLE_LENGTH &&
               port > 0 &&
               dimseTimeout.count() > 0;
    }
};

} // namespace dicom_transfer::services
