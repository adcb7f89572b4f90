#include "backup.hpp"
#include "change_detector.hpp"
#include "database_backup.hpp"
#include "file_backup.hpp"
#include "logger.hpp"
#include "retention.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <fmt/format.h>
#include <thread>

namespace {

BackupResult makeResult(const Site& site, ArtifactKind kind, UnitOutcome outcome, std::string detail) {
    return BackupResult{site.serverName, kind, outcome, std::move(detail)};
}

} // namespace

const char* unitOutcomeName(UnitOutcome outcome) {
    switch (outcome) {
    case UnitOutcome::Created:
        return "OK";
    case UnitOutcome::Skipped:
        return "SKIPPED";
    case UnitOutcome::Failed:
        return "FAILED";
    }
    return "UNKNOWN";
}

void ResultChannel::push(BackupResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(std::move(result));
    }
    ready.notify_one();
}

void ResultChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    ready.notify_all();
}

std::optional<BackupResult> ResultChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex);
    ready.wait(lock, [this] { return closed || !results.empty(); });
    if (results.empty()) {
        return std::nullopt;
    }
    auto result = std::move(results.front());
    results.pop_front();
    return result;
}

BackupOrchestrator::BackupOrchestrator(BackupLayout layout, const ArchiveEngine& archiver, const ChangeDetector& detector,
                                       DatabaseDumpStrategy& dumper, const RetentionManager& retention, Logger& logger,
                                       std::size_t maxParallelUnits)
    : layout(std::move(layout)), archiver(archiver), detector(detector), dumper(dumper), retention(retention),
      logger(logger), maxParallelUnits(maxParallelUnits) {}

std::vector<BackupResult> BackupOrchestrator::run(const std::vector<Site>& sites) {
    struct PendingUnit {
        const Site* site;
        ArtifactKind kind;
    };

    std::vector<PendingUnit> units;
    for (const auto& site : sites) {
        logger.logMessage(fmt::format("Starting backup for {}...", site.serverName));
        units.push_back({&site, ArtifactKind::Files});
        if (site.database.usable()) {
            units.push_back({&site, ArtifactKind::Database});
        } else {
            logger.logMessage(fmt::format("No database configuration for {}, skipping database backup", site.serverName));
        }
    }

    ResultChannel channel;
    std::atomic<std::size_t> next{0};
    auto drain = [this, &units, &next, &channel] {
        for (auto index = next++; index < units.size(); index = next++) {
            const auto& unit = units[index];
            channel.push(guarded(*unit.site, unit.kind, [this, &unit] {
                return unit.kind == ArtifactKind::Files ? backupFiles(*unit.site) : backupDatabase(*unit.site);
            }));
        }
    };

    auto poolSize = maxParallelUnits > 0 ? std::min(maxParallelUnits, units.size()) : units.size();
    std::vector<std::thread> workers;
    workers.reserve(poolSize);
    try {
        while (workers.size() < poolSize) {
            workers.emplace_back(drain);
        }
    } catch (const std::exception& e) {
        logger.logWarning(fmt::format("Started {} of {} backup workers: {}", workers.size(), poolSize, e.what()));
    }
    if (workers.empty()) {
        drain();
    }

    for (auto& worker : workers) {
        worker.join();
    }
    channel.close();

    std::vector<BackupResult> results;
    while (auto result = channel.pop()) {
        results.push_back(std::move(*result));
    }
    return results;
}

BackupResult BackupOrchestrator::guarded(const Site& site, ArtifactKind kind, const std::function<BackupResult()>& unit) {
    try {
        return unit();
    } catch (const std::exception& e) {
        auto errorMsg = fmt::format("Unexpected error during {} backup of {}: {}", artifactKindName(kind), site.serverName, e.what());
        logger.logError(errorMsg);
        return makeResult(site, kind, UnitOutcome::Failed, errorMsg);
    }
}

BackupResult BackupOrchestrator::backupFiles(const Site& site) {
    auto changed = detector.hasChanged(site.serverName, site.documentRoot);
    if (!changed) {
        logger.logWarning(fmt::format("Change check failed for {}, backing up anyway: {}", site.serverName, changed.error()));
    } else if (!*changed) {
        logger.logMessage(fmt::format("No changes detected for {}, skipping file backup", site.serverName));
        rotateWithWarnings(retention, logger, site.serverName, ArtifactKind::Files);
        return makeResult(site, ArtifactKind::Files, UnitOutcome::Skipped, "no changes since last backup");
    }

    auto target = layout.artifactPath(site.serverName, ArtifactKind::Files, artifactTimestamp(std::chrono::system_clock::now()));
    logger.logMessage(fmt::format("Creating file backup for {}...", site.serverName));
    auto created = archiver.create(site.documentRoot, target);
    if (!created) {
        auto errorMsg = fmt::format("File backup failed for {}: {}", site.serverName, created.error());
        logger.logError(errorMsg);
        return makeResult(site, ArtifactKind::Files, UnitOutcome::Failed, created.error());
    }
    logger.logMessage(fmt::format("Created backup for {} at {}", site.serverName, target.string()));

    rotateWithWarnings(retention, logger, site.serverName, ArtifactKind::Files);
    return makeResult(site, ArtifactKind::Files, UnitOutcome::Created, target.string());
}

BackupResult BackupOrchestrator::backupDatabase(const Site& site) {
    auto target = layout.artifactPath(site.serverName, ArtifactKind::Database, artifactTimestamp(std::chrono::system_clock::now()));
    logger.logMessage(fmt::format("Creating database backup for {} ({})...", site.serverName, site.database.name));
    auto dumped = dumper.dump(site.database, target);
    if (!dumped) {
        auto errorMsg = fmt::format("Database backup failed for {}: {}", site.serverName, dumped.error());
        logger.logError(errorMsg);
        return makeResult(site, ArtifactKind::Database, UnitOutcome::Failed, dumped.error());
    }
    logger.logMessage(fmt::format("Created database backup for {} at {}", site.serverName, target.string()));

    rotateWithWarnings(retention, logger, site.serverName, ArtifactKind::Database);
    return makeResult(site, ArtifactKind::Database, UnitOutcome::Created, target.string());
}

void rotateWithWarnings(const RetentionManager& retention, Logger& logger, const std::string& siteName, ArtifactKind kind) {
    auto removed = retention.rotate(siteName, kind);
    if (!removed) {
        logger.logWarning(fmt::format("Failed to clean old {} backups for {}: {}", artifactKindName(kind), siteName, removed.error()));
    } else if (*removed > 0) {
        logger.logMessage(fmt::format("Removed {} old {} backup(s) for {}", *removed, artifactKindName(kind), siteName));
    }
}

std::string formatSummary(DeploymentMode mode, const std::vector<BackupResult>& results) {
    std::size_t created = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    for (const auto& result : results) {
        switch (result.outcome) {
        case UnitOutcome::Created:
            ++created;
            break;
        case UnitOutcome::Skipped:
            ++skipped;
            break;
        case UnitOutcome::Failed:
            ++failed;
            break;
        }
    }

    std::string summary = fmt::format("Backup summary ({}): {} created, {} skipped, {} failed\n",
                                      deploymentModeName(mode), created, skipped, failed);
    for (const auto& result : results) {
        summary += fmt::format("  {:<8} {} [{}] {}\n", unitOutcomeName(result.outcome), result.siteName,
                               artifactKindName(result.kind), result.detail);
    }
    return summary;
}

bool allSucceeded(const std::vector<BackupResult>& results) {
    for (const auto& result : results) {
        if (!result.ok()) {
            return false;
        }
    }
    return true;
}
