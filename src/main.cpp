#include "backup_api.hpp"
#include "backup_config.hpp"
#include "logger.hpp"
#include <filesystem>
#include <iostream>

namespace {

constexpr const char* kDefaultConfigFile = "sitevault.json";

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--local-only | --remote-only] [--list-sites] [--help]\n"
              << "  --config <path>  JSON configuration (default: " << kDefaultConfigFile << " if present)\n"
              << "  --local-only     Back up local sites only\n"
              << "  --remote-only    Back up the remote host only\n"
              << "  --list-sites     Print discovered sites and exit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    RunOptions options;
    bool localOnly = false;
    bool remoteOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--local-only") {
            localOnly = true;
        } else if (arg == "--remote-only") {
            remoteOnly = true;
        } else if (arg == "--list-sites") {
            options.listOnly = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }
    if (localOnly && remoteOnly) {
        std::cerr << "Error: --local-only and --remote-only are mutually exclusive" << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    options.local = !remoteOnly;
    options.remote = !localOnly;

    BackupConfig config;
    try {
        if (!configFile.empty()) {
            config = BackupConfig(configFile);
        } else if (std::filesystem::exists(kDefaultConfigFile)) {
            config = BackupConfig(kDefaultConfigFile);
        }
        config.applyEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    Logger logger(config.logFile, config.errorLogFile);
    try {
        return BackupAPI::run(config, options, logger);
    } catch (const std::exception& e) {
        logger.logError(e.what());
        return 1;
    }
}
