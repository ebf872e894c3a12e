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
 * @file transfer_settings.hpp
 * @brief Persistent settings of the transfer tool
 * @details Holds logging options, the staging parent directory and a list of
 *          named PACS servers. TransferSettingsStore reads and writes them as
 *          a JSON document.
 *
 * ## File format
 * @code
 * {
 *   "log": { "level": "info", "file_logging": false, "directory": "" },
 *   "staging_parent": "",
 *   "pacs_servers": [
 *     { "name": "main", "hostname": "pacs.local", "port": 104,
 *       "called_ae_title": "PACS", "calling_ae_title": "DICOM_IMPORTER",
 *       "connection_timeout": 30, "dimse_timeout": 30, "max_pdu_size": 16384 }
 *   ]
 * }
 * @endcode
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/logging.hpp"
#include "services/pacs_config.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dicom_transfer::services {

/**
 * @brief PACS server stored under a user-chosen name
 */
struct NamedPacsServer {
    std::string name;
    PacsServerConfig config;
};

/**
 * @brief Settings loaded from the configuration file
 */
struct TransferSettings {
    /// File name looked up in the home directory
    static constexpr const char* DEFAULT_FILE_NAME = ".dicom_transfer.json";

    logging::LogLevel logLevel = logging::LogLevel::Info;
    bool fileLogging = false;
    std::filesystem::path logDirectory;

    /// Parent of job working directories; system temp when empty
    std::filesystem::path stagingParent;

    std::vector<NamedPacsServer> servers;

    /**
     * @brief Look up a saved server by name
     * @return Pointer into servers, or nullptr
     */
    [[nodiscard]] const PacsServerConfig* findServer(std::string_view name) const;

    /**
     * @brief Logging configuration derived from these settings
     */
    [[nodiscard]] logging::LogConfig toLogConfig() const;

    /**
     * @brief $HOME/.dicom_transfer.json, or the file name alone without HOME
     */
    [[nodiscard]] static std::filesystem::path defaultPath();
};

/**
 * @brief JSON persistence for TransferSettings
 */
class TransferSettingsStore {
public:
    /**
     * @brief Read settings from a file
     * @return Settings, or a message describing the read or parse error
     */
    [[nodiscard]] static std::expected<TransferSettings, std::string>
    load(const std::filesystem::path& path);

    /**
     * @brief Read settings, falling back to defaults when the file is absent
     */
    [[nodiscard]] static std::expected<TransferSettings, std::string>
    loadOrDefault(const std::filesystem::path& path);

    /**
     * @brief Write settings as indented JSON, creating parent directories
     */
    [[nodiscard]] static std::expected<void, std::string>
    save(const TransferSettings& settings, const std::filesystem::path& path);
};

} // namespace dicom_transfer::services
