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

#include "services/transfer_settings.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("Settings");
    return logger;
}

nlohmann::json serverToJson(const NamedPacsServer& server) {
    return {
        {"name", server.name},
        {"hostname", server.config.hostname},
        {"port", server.config.port},
        {"called_ae_title", server.config.calledAeTitle},
        {"calling_ae_title", server.config.callingAeTitle},
        {"connection_timeout", server.config.connectionTimeout.count()},
        {"dimse_timeout", server.config.dimseTimeout.count()},
        {"max_pdu_size", server.config.maxPduSize}
    };
}

std::expected<NamedPacsServer, std::string> serverFromJson(const nlohmann::json& j) {
    NamedPacsServer server;
    server.name = j.at("name").get<std::string>();
    server.config.hostname = j.at("hostname").get<std::string>();

    // Read wide so that out-of-range values are reported instead of wrapped
    auto port = j.value("port", int64_t{104});
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        return std::unexpected(std::format("PACS server '{}' has port {} outside 0-65535",
                                           server.name, port));
    }
    server.config.port = static_cast<uint16_t>(port);
    server.config.calledAeTitle = j.at("called_ae_title").get<std::string>();
    server.config.callingAeTitle = j.value(
        "calling_ae_title", std::string(PacsServerConfig::DEFAULT_CALLING_AE_TITLE));
    server.config.connectionTimeout = std::chrono::seconds(j.value("connection_timeout", 30));
    server.config.dimseTimeout = std::chrono::seconds(j.value("dimse_timeout", 30));
    server.config.maxPduSize = j.value("max_pdu_size", uint32_t{16384});
    return server;
}

} // anonymous namespace

const PacsServerConfig* TransferSettings::findServer(std::string_view name) const {
    auto it = std::find_if(servers.begin(), servers.end(),
                           [name](const NamedPacsServer& server) {
                               return server.name == name;
                           });
    return it != servers.end() ? &it->config : nullptr;
}

logging::LogConfig TransferSettings::toLogConfig() const {
    logging::LogConfig config;
    config.level = logLevel;
    config.enableFileLogging = fileLogging;
    config.logDirectory = logDirectory;
    return config;
}

std::filesystem::path TransferSettings::defaultPath() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / DEFAULT_FILE_NAME;
    }
    return DEFAULT_FILE_NAME;
}

std::expected<TransferSettings, std::string>
TransferSettingsStore::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected("Cannot open settings file " + path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    TransferSettings settings;
    try {
        auto j = nlohmann::json::parse(buffer.str());

        if (auto log = j.find("log"); log != j.end()) {
            auto levelName = log->value("level", std::string("info"));
            auto level = logging::parseLogLevel(levelName);
            if (!level) {
                return std::unexpected("Unknown log level '" + levelName + "' in " +
                                       path.string());
            }
            settings.logLevel = *level;
            settings.fileLogging = log->value("file_logging", false);
            settings.logDirectory = log->value("directory", std::string());
        }

        settings.stagingParent = j.value("staging_parent", std::string());

        if (auto servers = j.find("pacs_servers"); servers != j.end()) {
            for (const auto& item : *servers) {
                auto parsed = serverFromJson(item);
                if (!parsed) {
                    return std::unexpected("Invalid settings file " + path.string() + ": " +
                                           parsed.error());
                }
                auto server = std::move(*parsed);
                if (!server.config.isValid()) {
                    getLogger()->warn("Ignoring invalid PACS server entry '{}' in {}",
                                      server.name, path.string());
                    continue;
                }
                settings.servers.push_back(std::move(server));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid settings file " + path.string() + ": " + e.what());
    }

    getLogger()->debug("Loaded settings from {} ({} PACS servers)",
                       path.string(), settings.servers.size());
    return settings;
}

std::expected<TransferSettings, std::string>
TransferSettingsStore::loadOrDefault(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return TransferSettings{};
    }
    return load(path);
}

std::expected<void, std::string>
TransferSettingsStore::save(const TransferSettings& settings,
                            const std::filesystem::path& path) {
    nlohmann::json servers = nlohmann::json::array();
    for (const auto& server : settings.servers) {
        servers.push_back(serverToJson(server));
    }

    nlohmann::json j = {
        {"log", {
            {"level", std::string(logging::toString(settings.logLevel))},
            {"file_logging", settings.fileLogging},
            {"directory", settings.logDirectory.string()}
        }},
        {"staging_parent", settings.stagingParent.string()},
        {"pacs_servers", servers}
    };

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected("Cannot create directory " +
                                   path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return std::unexpected("Cannot write settings file " + path.string());
    }
    out << j.dump(2) << '\n';
    if (!out) {
        return std::unexpected("Failed while writing settings file " + path.string());
    }
    return {};
}

} // namespace dicom_transfer::services
