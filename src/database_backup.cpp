#include "database_backup.hpp"
#include "artifact.hpp"
#include "process.hpp"
#include "remote_shell.hpp"
#include <fmt/format.h>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

MySQLDumpStrategy::MySQLDumpStrategy(DumpOptions options) : options(std::move(options)) {}

std::expected<void, std::string> MySQLDumpStrategy::dump(const DatabaseConfig& database, const fs::path& destFile) {
    if (!database.usable()) {
        return std::unexpected("Invalid MySQL credentials: database name or user missing");
    }

    std::error_code ec;
    fs::create_directories(destFile.parent_path(), ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create directory {}: {}", destFile.parent_path().string(), ec.message()));
    }

    auto partial = partialPath(destFile);
    gzFile outFile = gzopen(partial.c_str(), "wb");
    if (!outFile) {
        return std::unexpected(fmt::format("Failed to open gzip file for writing: {}", partial.string()));
    }

    bool compressFailed = false;
    auto compress = [&](const char* data, std::size_t size) {
        if (gzwrite(outFile, data, static_cast<unsigned>(size)) != static_cast<int>(size)) {
            compressFailed = true;
            return false;
        }
        return true;
    };

    ProcessOptions processOptions;
    processOptions.timeout = options.timeout;
    processOptions.environment.emplace_back("MYSQL_PWD", database.password);
    std::vector<std::string> argv = {
        options.program,
        "-h", database.effectiveHost(),
        "-u", database.user,
        "--quick",
        "--lock-tables=false",
        database.name,
    };

    auto result = runProcess(argv, compress, processOptions);
    int closeStatus = gzclose(outFile);

    std::string errorMsg;
    if (!result) {
        errorMsg = fmt::format("Failed to execute {}: {}", options.program, result.error());
    } else if (compressFailed) {
        errorMsg = fmt::format("Failed to compress database dump into {}", partial.string());
    } else if (!result->succeeded()) {
        errorMsg = describeFailure(options.program, *result);
    } else if (closeStatus != Z_OK) {
        errorMsg = fmt::format("Failed to finish gzip file {} (zlib status {})", partial.string(), closeStatus);
    }

    if (!errorMsg.empty()) {
        fs::remove(partial, ec);
        return std::unexpected(errorMsg);
    }

    fs::rename(partial, destFile, ec);
    if (ec) {
        fs::remove(partial, ec);
        return std::unexpected(fmt::format("Failed to move dump into place at {}: {}", destFile.string(), ec.message()));
    }
    return {};
}

std::string remoteDumpCommand(const DatabaseConfig& database, const std::string& remoteFile) {
    // mysqldump streams straight into gzip; its exit status travels through a side file
    // because a plain sh pipeline only reports the status of its last command.
    auto statusFile = shellPath(remoteFile + ".status");
    return fmt::format("( ( MYSQL_PWD={} mysqldump -h {} -u {} --quick --lock-tables=false {}; echo $? > {} ) | gzip -c > {}; "
                       "zipped=$?; dumped=$(cat {} 2>/dev/null); rm -f {}; "
                       "if [ \"$zipped\" -eq 0 ] && [ \"$dumped\" = 0 ]; then exit 0; fi; rm -f {}; exit 1 )",
                       shellQuote(database.password), shellQuote(database.effectiveHost()), shellQuote(database.user),
                       shellQuote(database.name), statusFile, shellPath(remoteFile), statusFile, statusFile,
                       shellPath(remoteFile));
}
