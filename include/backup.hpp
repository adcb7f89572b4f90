/**
 * @file backup.hpp
 * @brief Local backup orchestration for SiteVault.
 *
 * Every discovered site yields up to two independent units of work: a file archive and,
 * when the site has usable database credentials, a database dump. A fixed pool of worker
 * threads pulls units from a shared list and reports into a ResultChannel; the channel is
 * closed only after every worker has been joined, so the collecting loop ends exactly when
 * all results are in.
 *
 * A unit never throws across its thread boundary. Failures become BackupResult values,
 * and retention problems are logged as warnings without failing the unit.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "artifact.hpp"
#include "site.hpp"

class ArchiveEngine;
class ChangeDetector;
class DatabaseDumpStrategy;
class Logger;
class RetentionManager;

/**
 * @brief How one unit of work ended.
 */
enum class UnitOutcome {
    Created, ///< A new artifact is in place.
    Skipped, ///< Nothing to do this cycle.
    Failed   ///< The unit failed; detail carries the diagnostic.
};

const char* unitOutcomeName(UnitOutcome outcome);

/**
 * @brief Outcome of one (site, artifact kind) unit.
 */
struct BackupResult {
    std::string siteName;
    ArtifactKind kind = ArtifactKind::Files;
    UnitOutcome outcome = UnitOutcome::Failed;
    std::string detail; ///< Artifact path, skip reason or verbatim error.

    bool ok() const { return outcome != UnitOutcome::Failed; }
};

/**
 * @brief Multi-producer, single-consumer queue of unit results.
 */
class ResultChannel {
public:
    void push(BackupResult result);

    /**
     * @brief Marks the end of input. Pending results can still be popped.
     */
    void close();

    /**
     * @brief Blocks until a result is available or the channel is closed and empty.
     *
     * @return The next result, or std::nullopt once no more results will arrive.
     */
    std::optional<BackupResult> pop();

private:
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<BackupResult> results;
    bool closed = false;
};

/**
 * @brief Concurrent local backup of a set of sites.
 */
class BackupOrchestrator {
public:
    /**
     * @brief Constructs an orchestrator for the local backup root.
     *
     * @param layout Local backup root.
     * @param archiver Archive writer.
     * @param detector Change detector bound to the same root.
     * @param dumper Database dump strategy; must tolerate concurrent calls.
     * @param retention Rotation for the same root.
     * @param logger Operator log.
     * @param maxParallelUnits Size of the worker pool; 0 means one worker per unit.
     */
    BackupOrchestrator(BackupLayout layout, const ArchiveEngine& archiver, const ChangeDetector& detector,
                       DatabaseDumpStrategy& dumper, const RetentionManager& retention, Logger& logger,
                       std::size_t maxParallelUnits = 0);

    /**
     * @brief Backs up every site and collects one result per started unit.
     *
     * Sites without usable database credentials start no database unit. Results arrive in
     * completion order. If fewer workers can be started than requested, the ones that did
     * start take over the remaining units; if none can, the units run on the calling thread.
     */
    std::vector<BackupResult> run(const std::vector<Site>& sites);

private:
    BackupResult backupFiles(const Site& site);
    BackupResult backupDatabase(const Site& site);
    BackupResult guarded(const Site& site, ArtifactKind kind, const std::function<BackupResult()>& unit);

    BackupLayout layout;
    const ArchiveEngine& archiver;
    const ChangeDetector& detector;
    DatabaseDumpStrategy& dumper;
    const RetentionManager& retention;
    Logger& logger;
    std::size_t maxParallelUnits;
};

/**
 * @brief Rotates one kind for one site, logging deletions and warning on failure.
 */
void rotateWithWarnings(const RetentionManager& retention, Logger& logger, const std::string& siteName, ArtifactKind kind);

/**
 * @brief Renders the per-unit run summary printed after each mode.
 */
std::string formatSummary(DeploymentMode mode, const std::vector<BackupResult>& results);

/**
 * @brief Whether no unit failed.
 */
bool allSucceeded(const std::vector<BackupResult>& results);

#endif // BACKUP_HPP
