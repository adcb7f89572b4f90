/**
 * @file remote_shell.hpp
 * @brief Command execution and file retrieval on a remote host.
 *
 * RemoteSession implements this over SSH; the remote backup path depends only on this
 * interface.
 */

#ifndef REMOTE_SHELL_HPP
#define REMOTE_SHELL_HPP

#include <expected>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Output and exit status of one remote command.
 */
struct CommandResult {
    int exitStatus = -1;     ///< Remote exit status.
    std::string output;      ///< Captured stdout.
    std::string errorOutput; ///< Captured stderr.
};

/**
 * @brief A POSIX shell on another host.
 */
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    /**
     * @brief Runs a shell command and captures both output streams.
     *
     * @return The command result, or an error if the command could not be run at all
     *         (transport failure, timeout).
     */
    virtual std::expected<CommandResult, std::string> execute(const std::string& command) = 0;

    /**
     * @brief Runs a shell command and streams its stdout into a local file.
     *
     * Fails if the command exits non-zero; the error carries its stderr.
     */
    virtual std::expected<void, std::string> runToFile(const std::string& command, const fs::path& localPath) = 0;

    /**
     * @brief Copies a remote file to a local path with a separate secure-copy process.
     */
    virtual std::expected<void, std::string> transferOut(const std::string& remotePath, const fs::path& localPath) = 0;

    /**
     * @brief Runs a shell command and returns its stdout, failing on a non-zero exit.
     */
    std::expected<std::string, std::string> run(const std::string& command);
};

/**
 * @brief Quotes a value as a single POSIX shell word.
 */
std::string shellQuote(const std::string& value);

/**
 * @brief Quotes a remote path, leaving a leading "~/" expandable by the shell.
 */
std::string shellPath(const std::string& path);

#endif // REMOTE_SHELL_HPP
