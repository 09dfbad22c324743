/**
 * Takeout Importer - Resumable Takeout archive importer
 *
 * Main entry point. Downloads the selected Takeout archives from Drive,
 * extracts their media and uploads it to an Immich server. Every step is
 * checkpointed so an interrupted run picks up where it stopped.
 */

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/Logger.hpp"
#include "core/Config.hpp"
#include "core/CancellationToken.hpp"
#include "core/TransferError.hpp"
#include "core/source/DriveClient.hpp"
#include "core/ingest/ImmichClient.hpp"
#include "core/state/CheckpointStore.hpp"
#include "core/transfer/ProgressSink.hpp"
#include "core/transfer/TransferCoordinator.hpp"
#include "cli/SelectionParser.hpp"
#include "utils/FileUtils.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using namespace takeout;
using takeout::utils::StringUtils;

namespace {

constexpr const char* kVersion = "1.0.0";

// Shared with the signal handler; cancel() is a lock-free atomic store
core::CancellationToken g_cancel;
volatile std::sig_atomic_t g_signalCount = 0;

/**
 * First signal pauses the run at the next chunk or entry, the second one quits
 */
void signalHandler(int) {
    g_signalCount = g_signalCount + 1;
    if (g_signalCount > 1) {
        std::_Exit(130);
    }
    g_cancel.cancel();
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct CliOptions {
    std::string serverUrl;
    std::string apiKey;
    std::string accessToken;
    std::string dataDir;
    std::string selection;
    bool assumeYes{false};
    bool reset{false};
    bool debug{false};
};

void printHelp(const char* program) {
    std::cout << "TakeoutImporter - Import Google Takeout archives into Immich\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --server URL          Immich server URL\n"
              << "  --api-key KEY         Immich API key\n"
              << "  --access-token TOKEN  Google Drive OAuth access token\n"
              << "  --data-dir DIR        State, downloads and logs directory\n"
              << "  --select LIST         Archives to import: \"all\" or e.g. \"1,3\"\n"
              << "  -y, --yes             Resume an interrupted import without asking\n"
              << "  --reset               Discard the saved import state\n"
              << "  -d, --debug           Enable debug logging\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << std::endl;
}

/**
 * @return Exit code if the program should stop, nullopt to continue
 */
std::optional<int> parseArguments(int argc, char* argv[], CliOptions& options) {
    auto needValue = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        std::optional<std::string> value;

        if (arg == "--help" || arg == "-h") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "TakeoutImporter v" << kVersion << std::endl;
            return 0;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--yes" || arg == "-y") {
            options.assumeYes = true;
        } else if (arg == "--reset") {
            options.reset = true;
        } else if (arg == "--server") {
            if (!(value = needValue(i, arg))) return 1;
            options.serverUrl = *value;
        } else if (arg == "--api-key") {
            if (!(value = needValue(i, arg))) return 1;
            options.apiKey = *value;
        } else if (arg == "--access-token") {
            if (!(value = needValue(i, arg))) return 1;
            options.accessToken = *value;
        } else if (arg == "--data-dir") {
            if (!(value = needValue(i, arg))) return 1;
            options.dataDir = *value;
        } else if (arg == "--select") {
            if (!(value = needValue(i, arg))) return 1;
            options.selection = *value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printHelp(argv[0]);
            return 1;
        }
    }
    return std::nullopt;
}

/**
 * Load the config file and apply command-line overrides
 */
bool loadConfiguration(const fs::path& dataDir, const CliOptions& options) {
    auto& config = core::Config::instance();
    fs::path configPath = utils::PathUtils::getConfigPath(dataDir);

    if (fs::exists(configPath)) {
        if (!config.load(configPath.string())) {
            TAKEOUT_LOG_ERROR("Configuration file {} is not valid JSON", configPath.string());
            return false;
        }
        TAKEOUT_LOG_INFO("Configuration loaded from {}", configPath.string());
    }

    if (!options.serverUrl.empty()) config.set("server.url", options.serverUrl);
    if (!options.apiKey.empty()) config.set("server.apiKey", options.apiKey);
    if (!options.accessToken.empty()) config.set("source.accessToken", options.accessToken);
    config.set("paths.dataDir", dataDir.string());

    if (!config.save(configPath.string())) {
        TAKEOUT_LOG_WARN("Could not write configuration to {}", configPath.string());
    }
    return true;
}

std::string prompt(const std::string& question) {
    std::cout << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return "";
    }
    return line;
}

/**
 * Ask which archives to import
 * @return Selected archives, empty if the answer was invalid
 */
std::vector<core::source::ArchiveInfo> selectArchives(
    const std::vector<core::source::ArchiveInfo>& archives,
    const CliOptions& options
) {
    std::cout << "\nAvailable archives:\n";
    for (size_t i = 0; i < archives.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << archives[i].name
                  << " (" << StringUtils::formatBytes(archives[i].size) << ")\n";
    }

    std::string answer = options.selection;
    if (answer.empty()) {
        answer = prompt("\nSelect archives (\"all\" or e.g. \"1,3\"): ");
    }

    std::vector<core::source::ArchiveInfo> selected;
    auto indices = cli::parseSelection(answer, archives.size());
    if (!indices) {
        std::cerr << "Invalid selection: " << answer << "\n";
        return selected;
    }
    for (size_t index : *indices) {
        selected.push_back(archives[index]);
    }
    return selected;
}

void printProgress(const core::transfer::ProgressEvent& event) {
    using core::transfer::ProgressPhase;

    switch (event.phase) {
        case ProgressPhase::Downloading: {
            double percent = event.bytesTotal > 0
                ? static_cast<double>(event.bytesDone) / static_cast<double>(event.bytesTotal) * 100.0
                : 0.0;
            std::cout << "\r[Download " << (event.completedCount + 1) << "/" << event.totalCount << "] "
                      << StringUtils::truncate(event.currentItemName, 40) << " "
                      << StringUtils::formatPercentage(percent) << " ("
                      << StringUtils::formatBytes(event.bytesDone) << ")   " << std::flush;
            break;
        }
        case ProgressPhase::Uploading:
            std::cout << "\r[Upload " << event.completedCount << "/" << event.totalCount << "] "
                      << StringUtils::truncate(event.currentItemName, 50) << "          " << std::flush;
            break;
        case ProgressPhase::Complete:
            std::cout << "\nImported " << event.completedCount << " of " << event.totalCount
                      << " media items." << std::endl;
            break;
    }
}

int runImport(const fs::path& dataDir, const CliOptions& options) {
    auto& config = core::Config::instance();

    std::string serverUrl = config.get<std::string>("server.url", "");
    std::string apiKey = config.get<std::string>("server.apiKey", "");
    std::string accessToken = config.get<std::string>("source.accessToken", "");

    if (serverUrl.empty() || apiKey.empty()) {
        std::cerr << "Server URL and API key are required (--server, --api-key).\n";
        return 1;
    }

    TAKEOUT_LOG_DEBUG("Server {} (API key {}, access token {})", serverUrl,
                      core::Logger::redact(apiKey), core::Logger::redact(accessToken));

    core::source::DriveClient drive(accessToken);
    core::ingest::ImmichClient immich(serverUrl, apiKey);
    core::state::CheckpointStore store(utils::PathUtils::getStatePath(dataDir));
    core::transfer::AsyncProgressSink progress(printProgress);

    core::transfer::TransferCoordinator coordinator(
        drive, immich, store, utils::PathUtils::getDownloadsPath(dataDir), progress);

    if (options.reset) {
        coordinator.reset();
        std::cout << "Previous import state cleared.\n";
    }

    try {
        coordinator.loadExisting();
    } catch (const core::TransferError& e) {
        TAKEOUT_LOG_CRITICAL("{}", e.what());
        std::cerr << "The saved import state at " << store.path().string()
                  << " is unreadable. Run with --reset to discard it.\n";
        return 1;
    }

    bool resuming = false;
    if (coordinator.hasJob() && coordinator.job().isResumable()) {
        const auto& job = coordinator.job();
        std::cout << "Found an unfinished import (" << jobStatusToString(job.status) << ", "
                  << job.files.size() << " archives, download "
                  << StringUtils::formatPercentage(job.downloadPercent()) << ", upload "
                  << StringUtils::formatPercentage(job.uploadPercent()) << ").\n";
        if (!job.lastError.empty()) {
            std::cout << "Last error: " << job.lastError << "\n";
        }

        resuming = options.assumeYes || cli::parseConfirmation(prompt("Resume previous import? [Y/n] "));
        if (!resuming) {
            coordinator.reset();
        }
    }

    std::string pingError = immich.ping();
    if (!pingError.empty()) {
        std::cerr << "Cannot reach " << serverUrl << ": " << pingError << "\n";
        return 1;
    }

    if (!resuming) {
        if (accessToken.empty()) {
            std::cerr << "A Drive access token is required to list archives (--access-token).\n";
            return 1;
        }

        auto archives = drive.listEligibleArchives();
        if (archives.empty()) {
            std::cout << "No Takeout archives found in Drive.\n";
            return 0;
        }

        auto selected = selectArchives(archives, options);
        if (selected.empty()) {
            return 1;
        }
        coordinator.begin(selected, serverUrl);
    }

    JobStatus status = coordinator.run(g_cancel);
    progress.stop();

    switch (status) {
        case JobStatus::Complete:
            std::cout << "Import complete.\n";
            return 0;
        case JobStatus::Cancelled:
            std::cout << "\nImport paused. Run again to resume.\n";
            return 0;
        default:
            std::cerr << "\nImport failed: " << coordinator.job().lastError
                      << "\nRun again to resume from where it stopped.\n";
            return 1;
    }
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CliOptions options;
    if (auto exitCode = parseArguments(argc, argv, options)) {
        return *exitCode;
    }

    fs::path dataDir = options.dataDir.empty() ? utils::PathUtils::getAppDataPath() : fs::path(options.dataDir);

    std::error_code ec;
    if (!utils::FileUtils::createPrivateDirectory(dataDir, ec)) {
        std::cerr << "Cannot create data directory " << dataDir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    auto& logger = core::Logger::instance();
    logger.initialize(options.debug ? core::LogLevel::Debug : core::LogLevel::Info,
                      utils::PathUtils::getLogsPath(dataDir).string());
    TAKEOUT_LOG_INFO("TakeoutImporter v{} starting", kVersion);

    if (!loadConfiguration(dataDir, options)) {
        TAKEOUT_LOG_CRITICAL("Failed to load configuration");
        return 1;
    }
    if (!options.debug) {
        auto level = core::Config::instance().get<std::string>("logging.level", "info");
        logger.setLevel(core::Logger::parseLevel(level));
    }

    utils::FileLock lock(utils::PathUtils::getLockPath(dataDir));
    if (!lock.isLocked()) {
        std::cerr << "Another import is already running for " << dataDir.string() << "\n";
        return 1;
    }

    setupSignalHandlers();

    try {
        int exitCode = runImport(dataDir, options);
        TAKEOUT_LOG_INFO("TakeoutImporter exiting with code {}", exitCode);
        logger.flush();
        return exitCode;

    } catch (const core::TransferError& e) {
        TAKEOUT_LOG_CRITICAL("Fatal [{}]: {}", core::errorKindToString(e.kind()), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        TAKEOUT_LOG_CRITICAL("Unhandled exception: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
