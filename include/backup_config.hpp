/**
 * @file backup_config.hpp
 * @brief Configuration management for the SiteVault backup system.
 *
 * Settings come from built-in defaults, an optional JSON file and a fixed set of
 * environment variables, applied in that order. The engine never reads this class;
 * the command line layer converts it into the plain option structs each component
 * takes in its constructor.
 *
 * @note Configuration is loaded from a JSON file such as:
 * @code
 * {
 *   "apache_configs": ["/etc/apache2/sites-enabled/app.conf"],
 *   "local":  { "backup_root": "/var/backups/sites", "max_file_backups": 5 },
 *   "remote": { "enabled": true, "host": "web1", "user": "deploy", "key_path": "~/.ssh/id_ed25519" }
 * }
 * @endcode
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <json/json.h>
#include "database_backup.hpp"
#include "remote_backup.hpp"
#include "remote_transfer.hpp"
#include "retention.hpp"

/**
 * @brief When the run summary is sent to Telegram.
 */
enum class NotifyPolicy {
    Failure, ///< Only when a unit failed or the run aborted.
    Always   ///< After every run.
};

/**
 * @brief Configuration class for the backup system.
 */
class BackupConfig {
public:
    /**
     * @brief Environment lookup; returns nullptr for unset variables.
     */
    using EnvironmentLookup = std::function<const char*(const char*)>;

    /**
     * @brief Constructs a configuration holding only the built-in defaults.
     */
    BackupConfig();

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Keys absent from the file keep their defaults. Cross-field constraints are checked
     * later by applyEnvironment(), once overrides are in.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, malformed or holds a value of the wrong kind.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Applies REMOTE_BACKUP_ENABLED, SSH_* and *_MAX_*_BACKUPS overrides.
     *
     * Integer variables that do not parse are ignored.
     *
     * @param lookup Environment accessor, std::getenv by default.
     * @throws std::runtime_error If a numeric override does not fit an int or the result fails validation.
     */
    void applyEnvironment(const EnvironmentLookup& lookup = {});

    /**
     * @brief Checks cross-field constraints.
     *
     * @throws std::runtime_error On the first violated constraint.
     */
    void validate() const;

    bool telegramEnabled() const;

    std::string logFile;                              ///< Message log; empty means console only.
    std::string errorLogFile;                         ///< Warning/error log; empty means console only.
    std::vector<std::string> apacheConfigFiles{"/etc/apache2/conf/httpd.conf"}; ///< Local discovery sources.
    std::string excludedDirectory = "node_modules";   ///< Left out of archives and change checks.
    std::size_t maxParallelUnits = 0;                 ///< Local concurrency bound; 0 means unbounded.

    std::string localBackupRoot = "/laravel-backup-script";      ///< Local-mode backup root.
    RetentionPolicy localRetention;                              ///< Local-mode maxima.
    DumpOptions dumpOptions;                                     ///< Local database dumps.

    bool remoteEnabled = false;                                  ///< Run the remote mode after the local one.
    std::string remoteBackupRoot = "/laravel-backup-script-ssh"; ///< Remote-mode backup root on this host.
    RetentionPolicy remoteRetention;                             ///< Remote-mode maxima.
    RemoteConfig remote;                                         ///< SSH connection settings.
    RemoteBackupOptions remoteOptions;                           ///< Remote scratch and transfer settings.

    Json::Value telegramConfig;                       ///< bot_token and chat_id, may be null.
    NotifyPolicy notifyOn = NotifyPolicy::Failure;    ///< When notifications are sent.
};

#endif // BACKUP_CONFIG_HPP
