#include "remote_backup.hpp"
#include "change_detector.hpp"
#include "database_backup.hpp"
#include "logger.hpp"
#include "remote_shell.hpp"
#include "retention.hpp"
#include <chrono>
#include <fmt/format.h>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

constexpr int kExitNotFound = 3;
constexpr int kExitUnreadable = 4;

const std::vector<std::string> kFallbackConfigs = {
    "/etc/apache2/apache2.conf",
    "/etc/apache2/httpd.conf",
    "/etc/httpd/conf/httpd.conf",
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        auto last = line.find_last_not_of(" \t\r");
        lines.push_back(line.substr(first, last - first + 1));
    }
    return lines;
}

BackupResult makeResult(const Site& site, ArtifactKind kind, UnitOutcome outcome, std::string detail) {
    return BackupResult{site.serverName, kind, outcome, std::move(detail)};
}

} // namespace

RemoteConfigSource::RemoteConfigSource(RemoteShell& shell, Logger& logger) : shell(shell), logger(logger) {}

std::vector<std::string> RemoteConfigSource::configFiles() {
    std::vector<std::string> files;
    auto listing = shell.execute(
        "find /etc -type f -name 'httpd*.conf' 2>/dev/null; "
        "find /etc/apache2 -type f -name '*.conf' 2>/dev/null; "
        "for f in /etc/apache2/sites-enabled/*; do [ -f \"$f\" ] && echo \"$f\"; done; true");
    if (!listing) {
        logger.logWarning(fmt::format("Failed to find Apache configs: {}", listing.error()));
    } else {
        std::set<std::string> seen;
        for (auto& path : splitLines(listing->output)) {
            if (seen.insert(path).second) {
                files.push_back(std::move(path));
            }
        }
    }

    if (files.empty()) {
        logger.logMessage("No Apache configs found, trying default locations");
        files = kFallbackConfigs;
    }
    return files;
}

std::expected<std::string, ReadError> RemoteConfigSource::readFile(const std::string& path) {
    auto quoted = shellPath(path);
    auto result = shell.execute(fmt::format("if [ ! -e {0} ]; then exit {1}; elif [ ! -r {0} ]; then exit {2}; else cat {0}; fi",
                                            quoted, kExitNotFound, kExitUnreadable));
    if (!result) {
        logger.logWarning(fmt::format("Failed to read remote file {}: {}", path, result.error()));
        return std::unexpected(ReadError::Unreadable);
    }
    if (result->exitStatus == kExitNotFound) {
        return std::unexpected(ReadError::NotFound);
    }
    if (result->exitStatus != 0) {
        return std::unexpected(ReadError::Unreadable);
    }
    return std::move(result->output);
}

RemoteBackupOrchestrator::RemoteBackupOrchestrator(RemoteShell& shell, BackupLayout layout, const RetentionManager& retention,
                                                   Logger& logger, RemoteBackupOptions options)
    : shell(shell), layout(std::move(layout)), retention(retention), logger(logger), options(std::move(options)) {
    const auto& temp = this->options.tempDirectory;
    if (temp.empty() || temp == "/" || temp == "~" || temp == "~/") {
        throw std::invalid_argument(fmt::format("Remote temp directory must be a dedicated directory, got '{}'", temp));
    }
}

std::vector<Site> RemoteBackupOrchestrator::discoverSites() {
    RemoteConfigSource source(shell, logger);
    SiteDirectory directory(logger);
    return directory.discover(source);
}

bool RemoteBackupOrchestrator::hasBackupFromToday(const std::string& siteName) const {
    auto today = artifactTimestamp(std::chrono::system_clock::now()).substr(0, 10);
    for (auto kind : {ArtifactKind::Files, ArtifactKind::Database}) {
        std::error_code ec;
        for (fs::directory_iterator it(layout.artifactDirectory(siteName, kind), ec), end; !ec && it != end; it.increment(ec)) {
            auto created = parseArtifactTimestamp(it->path().filename().string(), kind);
            if (created && artifactTimestamp(std::chrono::system_clock::from_time_t(*created)).substr(0, 10) == today) {
                return true;
            }
        }
    }
    return false;
}

std::expected<std::vector<BackupResult>, std::string> RemoteBackupOrchestrator::run(const std::vector<Site>& sites) {
    auto scratch = shellPath(options.tempDirectory);
    logger.logMessage("Cleaning temporary directory...");
    if (auto prepared = shell.run(fmt::format("mkdir -p {0} && rm -rf {0}/*", scratch)); !prepared) {
        return std::unexpected(fmt::format("Failed to clean remote temp directory: {}", prepared.error()));
    }

    RemoteChangeDetector detector(shell, options.excludedDirectory);
    std::vector<BackupResult> results;
    for (const auto& site : sites) {
        logger.logMessage(fmt::format("Starting backup check for {}...", site.serverName));

        if (options.oncePerDay && hasBackupFromToday(site.serverName)) {
            logger.logMessage(fmt::format("Backup for {} already exists today, skipping...", site.serverName));
            results.push_back(makeResult(site, ArtifactKind::Files, UnitOutcome::Skipped, "already backed up today"));
            if (site.database.usable()) {
                results.push_back(makeResult(site, ArtifactKind::Database, UnitOutcome::Skipped, "already backed up today"));
            }
            continue;
        }

        logger.logMessage(fmt::format("Checking for changes in {}...", site.serverName));
        auto changed = detector.hasChanged(site.documentRoot);
        if (!changed) {
            logger.logWarning(fmt::format("Change check failed for {}, backing up anyway: {}", site.serverName, changed.error()));
        }
        results.push_back(backupFiles(site, !changed || *changed));

        if (site.database.usable()) {
            results.push_back(backupDatabase(site));
        } else {
            logger.logMessage(fmt::format("No database configuration for {}, skipping database backup", site.serverName));
        }
    }

    logger.logMessage("Cleaning up temporary directory...");
    if (auto cleaned = shell.run(fmt::format("rm -rf {}/*", scratch)); !cleaned) {
        logger.logWarning(fmt::format("Failed to clean remote temp directory: {}", cleaned.error()));
    }
    return results;
}

std::string RemoteBackupOrchestrator::remoteSiteDirectory(const Site& site) const {
    auto base = options.tempDirectory;
    if (base.back() != '/') {
        base += '/';
    }
    return base + site.serverName;
}

BackupResult RemoteBackupOrchestrator::backupFiles(const Site& site, bool changed) {
    if (!changed) {
        logger.logMessage(fmt::format("No changes detected in {}, skipping...", site.serverName));
        rotateWithWarnings(retention, logger, site.serverName, ArtifactKind::Files);
        return makeResult(site, ArtifactKind::Files, UnitOutcome::Skipped, "no files modified in the last 24 hours");
    }

    auto timestamp = artifactTimestamp(std::chrono::system_clock::now());
    auto remoteDir = remoteSiteDirectory(site);
    auto remoteFile = remoteDir + "/" + artifactFileName(ArtifactKind::Files, timestamp);
    std::string exclusion;
    if (!options.excludedDirectory.empty()) {
        exclusion = fmt::format("--exclude={} ", shellQuote(options.excludedDirectory));
    }

    logger.logMessage(fmt::format("Creating file backup for {}...", site.serverName));
    auto archived = shell.run(fmt::format("mkdir -p {} && cd {} && tar {}-czf {} .",
                                          shellPath(remoteDir), shellPath(site.documentRoot), exclusion, shellPath(remoteFile)));
    if (!archived) {
        auto errorMsg = fmt::format("Failed to create backup archive: {}", archived.error());
        logger.logError(fmt::format("Error backing up files for {}: {}", site.serverName, errorMsg));
        return makeResult(site, ArtifactKind::Files, UnitOutcome::Failed, errorMsg);
    }

    auto target = layout.artifactPath(site.serverName, ArtifactKind::Files, timestamp);
    logger.logMessage(fmt::format("Copying files backup for {} to local machine...", site.serverName));
    if (auto fetched = fetch(remoteFile, target); !fetched) {
        logger.logError(fmt::format("Error copying files backup for {}: {}", site.serverName, fetched.error()));
        return makeResult(site, ArtifactKind::Files, UnitOutcome::Failed, fetched.error());
    }
    logger.logMessage(fmt::format("Created backup for {} at {}", site.serverName, target.string()));

    rotateWithWarnings(retention, logger, site.serverName, ArtifactKind::Files);
    return makeResult(site, ArtifactKind::Files, UnitOutcome::Created, target.string());
}

BackupResult RemoteBackupOrchestrator::backupDatabase(const Site& site) {
    auto timestamp = artifactTimestamp(std::chrono::system_clock::now());
    auto remoteDir = remoteSiteDirectory(site) + "/database";
    auto remoteFile = remoteDir + "/" + artifactFileName(ArtifactKind::Database, timestamp);

    logger.logMessage(fmt::format("Creating database backup for {}...", site.serverName));
    auto dumped = shell.run(fmt::format("mkdir -p {} && {}", shellPath(remoteDir), remoteDumpCommand(site.database, remoteFile)));
    if (!dumped) {
        auto errorMsg = fmt::format("Failed to create database backup: {}", dumped.error());
        logger.logError(fmt::format("Error backing up database for {}: {}", site.serverName, errorMsg));
        return makeResult(site, ArtifactKind::Database, UnitOutcome::Failed, errorMsg);
    }

    auto target = layout.artifactPath(site.serverName, ArtifactKind::Database, timestamp);
    logger.logMessage(fmt::format("Copying database backup for {} to local machine...", site.serverName));
    if (auto fetched = fetch(remoteFile, target); !fetched) {
        logger.logError(fmt::format("Error copying database backup for {}: {}", site.serverName, fetched.error()));
        return makeResult(site, ArtifactKind::Database, UnitOutcome::Failed, fetched.error());
    }
    logger.logMessage(fmt::format("Created database backup for {} at {}", site.serverName, target.string()));

    rotateWithWarnings(retention, logger, site.serverName, ArtifactKind::Database);
    return makeResult(site, ArtifactKind::Database, UnitOutcome::Created, target.string());
}

std::expected<void, std::string> RemoteBackupOrchestrator::fetch(const std::string& remoteFile, const fs::path& destFile) {
    std::error_code ec;
    fs::create_directories(destFile.parent_path(), ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create local directory {}: {}", destFile.parent_path().string(), ec.message()));
    }

    auto partial = partialPath(destFile);
    std::expected<void, std::string> transferred;
    if (options.transferMode == RemoteTransferMode::SecureCopy) {
        transferred = shell.transferOut(remoteFile, partial);
    } else {
        transferred = shell.runToFile(fmt::format("cat {}", shellPath(remoteFile)), partial);
    }

    if (transferred) {
        fs::rename(partial, destFile, ec);
        if (ec) {
            transferred = std::unexpected(fmt::format("Failed to move {} into place: {}", destFile.string(), ec.message()));
        }
    }
    if (!transferred) {
        fs::remove(partial, ec);
    }

    if (auto removed = shell.run(fmt::format("rm -f {}", shellPath(remoteFile))); !removed) {
        logger.logWarning(fmt::format("Failed to remove remote backup file {}: {}", remoteFile, removed.error()));
    }
    return transferred;
}
