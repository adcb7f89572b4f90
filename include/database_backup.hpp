/**
 * @file database_backup.hpp
 * @brief Database dump strategies for SiteVault.
 *
 * A dump is an external client tool whose stdout is compressed on the fly into a
 * .sql.gz artifact. The tool's stderr is kept apart so a failure carries the
 * database server's own message.
 *
 * @note Requires the database client tools (e.g., mysqldump) on PATH and zlib.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include "site.hpp"

namespace fs = std::filesystem;

/**
 * @brief Interface for database dump strategies.
 */
class DatabaseDumpStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseDumpStrategy() = default;

    /**
     * @brief Dumps one database into a compressed file.
     *
     * @param database Connection parameters. Must be usable().
     * @param destFile Final .sql.gz path. Only present on success.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> dump(const DatabaseConfig& database, const fs::path& destFile) = 0;
};

/**
 * @brief Settings for MySQLDumpStrategy.
 */
struct DumpOptions {
    std::string program = "mysqldump";   ///< Dump client, looked up on PATH.
    std::chrono::seconds timeout{3600};  ///< Wall-clock limit per dump; zero means none.
};

/**
 * @brief MySQL dump strategy using mysqldump and zlib.
 *
 * Runs `mysqldump -h <host> -u <user> --quick --lock-tables=false <name>` with the
 * password in MYSQL_PWD and gzip-compresses its output into <destFile>.partial. The
 * partial file is renamed into place only when the dump exited with status 0 and the
 * gzip stream was closed cleanly; otherwise it is removed.
 */
class MySQLDumpStrategy : public DatabaseDumpStrategy {
public:
    explicit MySQLDumpStrategy(DumpOptions options = {});

    std::expected<void, std::string> dump(const DatabaseConfig& database, const fs::path& destFile) override;

private:
    DumpOptions options;
};

/**
 * @brief Shell command that dumps a database into a gzip file on a remote host.
 *
 * The dump is piped through gzip, so no uncompressed copy lands on the remote disk. The
 * command fails if mysqldump or gzip fails and leaves no output file behind in that case.
 *
 * @param database Connection parameters.
 * @param remoteFile Destination path on the remote host (ending in .sql.gz).
 */
std::string remoteDumpCommand(const DatabaseConfig& database, const std::string& remoteFile);

#endif // DATABASE_BACKUP_HPP
