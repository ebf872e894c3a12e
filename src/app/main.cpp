#include "core/dicom_file_info.hpp"
#include "core/logging.hpp"
#include "services/dicom_echo_scu.hpp"
#include "services/transfer/dicom_stager.hpp"
#include "services/transfer/transfer_job.hpp"
#include "services/transfer/transfer_worker.hpp"
#include "services/transfer_settings.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using namespace dicom_transfer;

constexpr const char* version_string = "1.0.0";

constexpr int exit_success = 0;
constexpr int exit_failure = 1;
constexpr int exit_usage = 2;

enum class verbosity_level {
    quiet,
    normal,
    verbose
};

struct options {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> server_name;
    verbosity_level verbosity{verbosity_level::normal};
    bool show_version{false};
};

std::atomic<bool> interrupt_requested{false};

extern "C" void on_interrupt(int) {
    interrupt_requested.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << R"( <command> [arguments] [options]

Commands:
  import <source> <staging>             Copy DICOM objects from removable media
                                        into a staging directory
  export-folder <source> <destination>  Stage and copy objects to a folder
  export-pacs <source> <host> <port> <ae-title> [client-ae-title]
  export-pacs <source> --server <name>  Stage and send objects with C-STORE
  test-pacs <host> <port> <ae-title> [client-ae-title]
  test-pacs --server <name>             Verify a PACS with C-ECHO
  info <file>                           Print key attributes of a DICOM file
  help                                  Show this help message

Options:
  --config <file>     Settings file (default: $HOME/.dicom_transfer.json)
  --server <name>     Use a PACS server saved in the settings file
  -v, --verbose       Debug logging
  -q, --quiet         Errors only, no progress output
  --version           Show version information
)";
}

bool parse_arguments(int argc, char* argv[], options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.command = "help";
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbosity = verbosity_level::verbose;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.verbosity = verbosity_level::quiet;
            continue;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file path\n";
                return false;
            }
            opts.config_path = argv[++i];
            continue;
        }
        if (arg == "--server") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --server requires a server name\n";
                return false;
            }
            opts.server_name = argv[++i];
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        }

        if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (opts.command.empty()) {
        opts.command = "help";
    }
    return true;
}

std::optional<uint16_t> parse_port(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 1 || value > 65535) {
        std::cerr << "Error: Invalid port number: " << text << "\n";
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

/**
 * @brief Build a PACS endpoint from --server or from positional arguments
 *
 * @param args host, port, called AE and optional calling AE
 */
std::optional<services::PacsServerConfig>
resolve_server(const options& opts,
               const services::TransferSettings& settings,
               const std::vector<std::string>& args) {
    if (opts.server_name) {
        const auto* saved = settings.findServer(*opts.server_name);
        if (!saved) {
            std::cerr << "Error: No PACS server named '" << *opts.server_name
                      << "' in settings\n";
            return std::nullopt;
        }
        return *saved;
    }

    if (args.size() < 3) {
        std::cerr << "Error: Expected <host> <port> <ae-title> [client-ae-title]\n";
        return std::nullopt;
    }

    services::PacsServerConfig config;
    config.hostname = args[0];
    auto port = parse_port(args[1]);
    if (!port) {
        return std::nullopt;
    }
    config.port = *port;
    config.calledAeTitle = args[2];
    if (args.size() > 3) {
        config.callingAeTitle = args[3];
    }

    if (!config.isValid()) {
        std::cerr << "Error: Invalid PACS configuration (AE titles must be 1-"
                  << services::MAX_AE_TITLE_LENGTH << " characters)\n";
        return std::nullopt;
    }
    return config;
}

void print_progress(const services::ProgressEvent& event, services::JobState& lastPhase) {
    if (event.phase != lastPhase) {
        if (lastPhase != services::JobState::Idle) {
            std::cout << "\n";
        }
        lastPhase = event.phase;
    }

    if (event.phase == services::JobState::Cleaning) {
        std::cout << "Cleaning up working directory" << std::flush;
        return;
    }

    std::cout << std::format("\r{:<12} {:>5}/{:<5} {:>3.0f}%  {}",
                             services::toString(event.phase),
                             event.phase == services::JobState::Scanning ? event.found
                                                                          : event.processed,
                             event.total, event.percentComplete(), event.currentFileName)
              << std::flush;
}

void print_summary(const services::JobResult& result, const std::filesystem::path& source) {
    if (result.finalState == services::JobState::Done && result.filesFound == 0) {
        std::cout << "No files found in " << source.string() << "; nothing to transfer.\n";
        return;
    }
    if (result.finalState == services::JobState::Done && result.filesStaged == 0) {
        std::cout << result.filesFound << " files inspected, no DICOM objects found; "
                  << "nothing to transfer.\n";
        return;
    }

    std::cout << std::format("Transfer {}: {} found, {} staged, {} dispatched, {} failed\n",
                             services::toString(result.finalState), result.filesFound,
                             result.filesStaged, result.filesDispatched, result.filesFailed);

    for (const auto& outcome : result.outcomes) {
        if (outcome.isAccepted()) {
            continue;
        }
        std::cout << std::format("  {} {}: {}\n", services::toString(outcome.kind),
                                 outcome.path.filename().string(), outcome.reason);
    }

    if (result.error) {
        std::cerr << "Error: " << result.error->toString() << "\n";
    }
}

int run_transfer(const options& opts,
                 const services::TransferSettings& settings,
                 const std::filesystem::path& source,
                 services::DestinationConfig destination) {
    services::TransferJobOptions jobOptions;
    jobOptions.stagingParent = settings.stagingParent;

    services::TransferWorker worker(
        std::make_unique<services::TransferJob>(source, std::move(destination), jobOptions));

    auto future = worker.start();
    auto lastPhase = services::JobState::Idle;
    bool cancelSent = false;

    for (;;) {
        if (interrupt_requested.load() && !cancelSent) {
            std::cerr << "\nInterrupted, cancelling transfer...\n";
            worker.cancel();
            cancelSent = true;
        }

        // The channel drains fully before waitPopFor reports it closed
        auto event = worker.progress().waitPopFor(std::chrono::milliseconds(200));
        if (event) {
            if (opts.verbosity != verbosity_level::quiet) {
                print_progress(*event, lastPhase);
            }
        } else if (worker.progress().isClosed()) {
            break;
        }
    }
    if (lastPhase != services::JobState::Idle && opts.verbosity != verbosity_level::quiet) {
        std::cout << "\n";
    }

    services::JobResult result = future.get();
    print_summary(result, source);

    return result.succeeded() ? exit_success : exit_failure;
}

int command_import(const options& opts) {
    if (opts.positional.size() < 2) {
        std::cerr << "Usage: import <source-path> <staging-path>\n";
        return exit_usage;
    }

    const std::filesystem::path source = opts.positional[0];
    const std::filesystem::path staging = opts.positional[1];

    std::error_code ec;
    std::filesystem::create_directories(staging, ec);
    if (ec) {
        std::cerr << "Error: Cannot create staging directory " << staging.string()
                  << ": " << ec.message() << "\n";
        return exit_failure;
    }

    auto lastPhase = services::JobState::Idle;
    services::ProgressSink sink;
    if (opts.verbosity != verbosity_level::quiet) {
        sink = [&lastPhase](const services::ProgressEvent& event) {
            print_progress(event, lastPhase);
        };
    }

    services::DicomStager stager;
    auto result = stager.stage(source, staging, sink);
    if (lastPhase != services::JobState::Idle) {
        std::cout << "\n";
    }
    if (!result) {
        std::cerr << "Error: " << result.error().toString() << "\n";
        return exit_failure;
    }

    for (const auto& skipped : result->skipped) {
        std::cout << std::format("  Skipped {}: {}\n", skipped.path.string(), skipped.reason);
    }
    std::cout << std::format("Import complete. {} of {} files imported to {}\n",
                             result->counts.staged, result->counts.found, staging.string());
    return exit_success;
}

int command_export_folder(const options& opts, const services::TransferSettings& settings) {
    if (opts.positional.size() < 2) {
        std::cerr << "Usage: export-folder <source-path> <destination-path>\n";
        return exit_usage;
    }
    return run_transfer(opts, settings, opts.positional[0],
                        services::FolderDestination{opts.positional[1]});
}

int command_export_pacs(const options& opts, const services::TransferSettings& settings) {
    if (opts.positional.empty()) {
        std::cerr << "Usage: export-pacs <source-path> <pacs-host> <pacs-port> "
                     "<pacs-ae-title> [client-ae-title]\n";
        return exit_usage;
    }

    std::vector<std::string> serverArgs(opts.positional.begin() + 1, opts.positional.end());
    auto config = resolve_server(opts, settings, serverArgs);
    if (!config) {
        return exit_usage;
    }
    return run_transfer(opts, settings, opts.positional[0], *config);
}

int command_test_pacs(const options& opts, const services::TransferSettings& settings) {
    auto config = resolve_server(opts, settings, opts.positional);
    if (!config) {
        return exit_usage;
    }

    std::cout << std::format("Testing connection to {}:{} (AE: {}, calling AE: {})...\n",
                             config->hostname, config->port, config->calledAeTitle,
                             config->callingAeTitle);

    services::DicomEchoSCU echo;
    auto result = echo.verify(*config);
    if (!result) {
        std::cout << "Connection failed: " << result.error().toString() << "\n";
        return exit_failure;
    }

    std::cout << std::format("Connection successful ({} ms)\n", result->latency.count());
    return exit_success;
}

int command_info(const options& opts) {
    if (opts.positional.empty()) {
        std::cerr << "Usage: info <dicom-file>\n";
        return exit_usage;
    }

    auto info = core::DicomFileInfo::read(opts.positional[0]);
    if (!info) {
        std::cerr << "Error: " << info.error().message << "\n";
        return exit_failure;
    }

    std::cout << "DICOM File Information:\n";
    for (const auto& [name, value] : info->fields()) {
        std::cout << std::format("  {:<20} {}\n", name + ":", value);
    }
    return exit_success;
}

int dispatch_command(const options& opts, const services::TransferSettings& settings) {
    if (opts.command == "import") {
        return command_import(opts);
    }
    if (opts.command == "export-folder") {
        return command_export_folder(opts, settings);
    }
    if (opts.command == "export-pacs") {
        return command_export_pacs(opts, settings);
    }
    if (opts.command == "test-pacs") {
        return command_test_pacs(opts, settings);
    }
    if (opts.command == "info") {
        return command_info(opts);
    }

    std::cerr << "Unknown command: " << opts.command << "\n\n";
    return exit_usage;
}

} // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        std::cerr << "\nUse --help for usage information.\n";
        return exit_usage;
    }

    if (opts.show_version) {
        std::cout << "dicom_transfer " << version_string << "\n";
        return exit_success;
    }

    if (opts.command == "help") {
        print_usage(argv[0]);
        return exit_success;
    }

    auto settingsPath = opts.config_path.value_or(services::TransferSettings::defaultPath());
    auto settings = opts.config_path
        ? services::TransferSettingsStore::load(settingsPath)
        : services::TransferSettingsStore::loadOrDefault(settingsPath);
    if (!settings) {
        std::cerr << "Error: " << settings.error() << "\n";
        return exit_failure;
    }

    auto logConfig = settings->toLogConfig();
    if (opts.verbosity == verbosity_level::verbose) {
        logConfig.level = logging::LogLevel::Debug;
    } else if (opts.verbosity == verbosity_level::quiet) {
        logConfig.level = logging::LogLevel::Error;
    }
    logging::LoggerFactory::configure(logConfig);

    std::signal(SIGINT, on_interrupt);

    int exitCode = dispatch_command(opts, *settings);
    if (exitCode == exit_usage && opts.command != "help") {
        print_usage(argv[0]);
    }

    logging::LoggerFactory::shutdown();
    return exitCode;
}
