/**
 * @file remote_backup.hpp
 * @brief Backups of sites hosted on another machine, driven over a RemoteShell.
 *
 * Archives and dumps are produced by the remote host's own tar, mysqldump and gzip in a
 * scratch directory, then pulled into the local remote-mode backup root. Sites are
 * processed one after another: every command goes through the same connection, and a
 * sequential run keeps the load on the remote host predictable.
 */

#ifndef REMOTE_BACKUP_HPP
#define REMOTE_BACKUP_HPP

#include <expected>
#include <string>
#include <vector>
#include "artifact.hpp"
#include "backup.hpp"
#include "site_directory.hpp"

class Logger;
class RemoteShell;
class RetentionManager;

/**
 * @brief ConfigSource that reads Apache configuration through a remote shell.
 */
class RemoteConfigSource : public ConfigSource {
public:
    RemoteConfigSource(RemoteShell& shell, Logger& logger);

    /**
     * @brief Lists httpd*.conf under /etc, *.conf under /etc/apache2 and the entries of
     * /etc/apache2/sites-enabled, falling back to the usual main configuration paths
     * when none are found.
     */
    std::vector<std::string> configFiles() override;

    std::expected<std::string, ReadError> readFile(const std::string& path) override;

private:
    RemoteShell& shell;
    Logger& logger;
};

/**
 * @brief How artifacts travel from the remote scratch directory to the local root.
 */
enum class RemoteTransferMode {
    SecureCopy,   ///< A separate scp process per artifact.
    ChannelStream ///< `cat` over a command channel into the local file.
};

/**
 * @brief Settings for RemoteBackupOrchestrator.
 */
struct RemoteBackupOptions {
    std::string excludedDirectory = "node_modules";        ///< Directory name left out of archives.
    std::string tempDirectory = "~/laravel-backup-temp";   ///< Remote scratch directory. Cleared at start and end.
    RemoteTransferMode transferMode = RemoteTransferMode::SecureCopy;
    bool oncePerDay = true;                                ///< Skip sites that already have an artifact from today.
};

/**
 * @brief Sequential per-site backup of a remote host.
 */
class RemoteBackupOrchestrator {
public:
    /**
     * @throws std::invalid_argument If the temp directory is empty, "/" or the home directory itself.
     */
    RemoteBackupOrchestrator(RemoteShell& shell, BackupLayout layout, const RetentionManager& retention,
                             Logger& logger, RemoteBackupOptions options = {});

    /**
     * @brief Discovers the sites configured on the remote host.
     */
    std::vector<Site> discoverSites();

    /**
     * @brief Backs up every site in order: files, then database, then rotation.
     *
     * @return One result per attempted unit, or an error if the remote scratch
     *         directory could not be prepared (no site work is started then).
     */
    std::expected<std::vector<BackupResult>, std::string> run(const std::vector<Site>& sites);

    /**
     * @brief Whether the local root already holds an artifact of this site stamped today.
     */
    bool hasBackupFromToday(const std::string& siteName) const;

private:
    BackupResult backupFiles(const Site& site, bool changed);
    BackupResult backupDatabase(const Site& site);

    /**
     * @brief Pulls a remote file into place atomically and deletes the remote copy.
     */
    std::expected<void, std::string> fetch(const std::string& remoteFile, const fs::path& destFile);

    std::string remoteSiteDirectory(const Site& site) const;

    RemoteShell& shell;
    BackupLayout layout;
    const RetentionManager& retention;
    Logger& logger;
    RemoteBackupOptions options;
};

#endif // REMOTE_BACKUP_HPP
