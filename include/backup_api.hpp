/**
 * @file backup_api.hpp
 * @brief High-level API for running SiteVault backups.
 *
 * Wires a resolved BackupConfig into the engine: local discovery and backup first, then
 * the remote host when remote mode is enabled, then the optional notification.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <string>
#include <vector>
#include "backup_config.hpp"
#include "site.hpp"

class Logger;

/**
 * @brief Which parts of a run to perform.
 */
struct RunOptions {
    bool local = true;     ///< Run the local mode.
    bool remote = true;    ///< Run the remote mode when it is enabled in the configuration.
    bool listOnly = false; ///< Discover and print sites without backing anything up.
};

/**
 * @brief API for running backups in SiteVault.
 */
class BackupAPI {
public:
    /**
     * @brief Performs one complete run.
     *
     * A remote connection failure aborts the remote mode only; the local results are
     * still reported and notified.
     *
     * @param config Resolved configuration.
     * @param options Modes to run.
     * @param logger Operator log.
     * @return 0 if every unit succeeded or was skipped, 1 if anything failed.
     * @throws std::exception On invalid settings discovered while building components.
     */
    static int run(const BackupConfig& config, const RunOptions& options, Logger& logger);

    /**
     * @brief Renders discovered sites for --list-sites, with passwords masked.
     */
    static std::string describeSites(const std::vector<Site>& sites);

    /**
     * @brief Whether a run with this outcome triggers a notification.
     */
    static bool shouldNotify(NotifyPolicy policy, bool failed);
};

#endif // BACKUP_API_HPP
