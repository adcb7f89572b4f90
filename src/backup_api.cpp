#include "backup_api.hpp"
#include "backup.hpp"
#include "change_detector.hpp"
#include "file_backup.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "remote_backup.hpp"
#include "remote_transfer.hpp"
#include "retention.hpp"
#include "site_directory.hpp"
#include <fmt/format.h>

namespace {

struct ModeReport {
    std::string text;
    bool failed = false;
};

void reportResults(DeploymentMode mode, const std::vector<BackupResult>& results, Logger& logger, ModeReport& report) {
    auto summary = formatSummary(mode, results);
    if (!summary.empty() && summary.back() == '\n') {
        summary.pop_back();
    }
    logger.logMessage(summary);
    report.text += summary + "\n";
    report.failed = report.failed || !allSucceeded(results);
}

void reportFatal(const std::string& errorMsg, Logger& logger, ModeReport& report) {
    logger.logError(errorMsg);
    report.text += errorMsg + "\n";
    report.failed = true;
}

void runLocal(const BackupConfig& config, const RunOptions& options, Logger& logger, ModeReport& report) {
    logger.logMessage("Starting local backups...");
    LocalConfigSource source(config.apacheConfigFiles);
    SiteDirectory directory(logger);
    auto sites = directory.discover(source);
    logger.logMessage(fmt::format("Found {} local site(s)", sites.size()));
    if (options.listOnly) {
        fmt::print("Local sites:\n{}", BackupAPI::describeSites(sites));
        return;
    }

    BackupLayout layout{config.localBackupRoot};
    ArchiveEngine archiver(ArchiveOptions{config.excludedDirectory});
    ChangeDetector detector(layout, archiver, logger);
    MySQLDumpStrategy dumper(config.dumpOptions);
    RetentionManager retention(layout, config.localRetention);
    BackupOrchestrator orchestrator(layout, archiver, detector, dumper, retention, logger, config.maxParallelUnits);
    reportResults(DeploymentMode::Local, orchestrator.run(sites), logger, report);
}

void runRemote(const BackupConfig& config, const RunOptions& options, Logger& logger, ModeReport& report) {
    logger.logMessage(fmt::format("Starting remote backups from {}@{}...", config.remote.user, config.remote.host));
    auto session = RemoteSession::open(config.remote, logger);
    if (!session) {
        reportFatal(fmt::format("Remote backup failed: {}", session.error()), logger, report);
        return;
    }

    BackupLayout layout{config.remoteBackupRoot};
    RetentionManager retention(layout, config.remoteRetention);
    RemoteBackupOrchestrator orchestrator(**session, layout, retention, logger, config.remoteOptions);
    auto sites = orchestrator.discoverSites();
    logger.logMessage(fmt::format("Found {} remote site(s)", sites.size()));
    if (options.listOnly) {
        fmt::print("Remote sites:\n{}", BackupAPI::describeSites(sites));
    } else if (auto results = orchestrator.run(sites); !results) {
        reportFatal(fmt::format("Remote backup failed: {}", results.error()), logger, report);
    } else {
        reportResults(DeploymentMode::Remote, *results, logger, report);
    }
    (*session)->close();
}

} // namespace

int BackupAPI::run(const BackupConfig& config, const RunOptions& options, Logger& logger) {
    ModeReport report;
    if (options.local) {
        runLocal(config, options, logger, report);
    }
    if (options.remote && config.remoteEnabled) {
        runRemote(config, options, logger, report);
    } else if (options.remote && !options.local) {
        logger.logWarning("Remote backup is not enabled; set remote.enabled or REMOTE_BACKUP_ENABLED=true");
    }

    if (!options.listOnly && config.telegramEnabled() && shouldNotify(config.notifyOn, report.failed)) {
        TelegramNotificationStrategy telegram(config.telegramConfig);
        if (auto sent = telegram.notify(report.text); !sent) {
            logger.logError(sent.error());
        }
    }
    return report.failed ? 1 : 0;
}

std::string BackupAPI::describeSites(const std::vector<Site>& sites) {
    std::string text;
    for (const auto& site : sites) {
        text += fmt::format("  {} -> {}\n", site.serverName, site.documentRoot);
        if (site.database.empty()) {
            text += "    database: none\n";
        } else {
            text += fmt::format("    database: {}@{}/{} (password: {})\n", site.database.user, site.database.effectiveHost(),
                                site.database.name, site.database.password.empty() ? "none" : "****");
        }
    }
    return text;
}

bool BackupAPI::shouldNotify(NotifyPolicy policy, bool failed) {
    return policy == NotifyPolicy::Always || failed;
}
