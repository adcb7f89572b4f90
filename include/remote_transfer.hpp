/**
 * @file remote_transfer.hpp
 * @brief SSH connection to a remote web server for SiteVault.
 *
 * A RemoteSession owns one authenticated libssh connection and a SessionPool of
 * command channels over it. Bulk file retrieval does not go through the pooled
 * channels: it shells out to scp with the same credentials.
 *
 * @note Requires libssh (0.8 or newer). Install libssh-dev or equivalent on Linux.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include "remote_shell.hpp"
#include "session_pool.hpp"

class Logger;
struct ssh_session_struct;

/**
 * @brief How the remote host key is checked.
 */
enum class HostKeyPolicy {
    KnownHosts, ///< The key must match the known_hosts file.
    AcceptAny   ///< Any key is accepted. Low-assurance operation only.
};

/**
 * @brief Connection settings for the remote host.
 */
struct RemoteConfig {
    std::string host;                                   ///< Remote host name or address.
    int port = 22;                                      ///< SSH port.
    std::string user;                                   ///< Login user.
    std::string keyPath;                                ///< Private key file. Tried first when set.
    std::string password;                               ///< Password. Used when no key is set or the key is refused.
    HostKeyPolicy hostKeyPolicy = HostKeyPolicy::KnownHosts; ///< Host identity verification.
    std::string knownHostsFile;                         ///< Overrides the libssh default known_hosts path.
    std::chrono::seconds connectTimeout{30};            ///< Connect and authentication timeout.
    std::chrono::seconds commandTimeout{3600};          ///< Limit for each remote command and transfer.
    std::size_t channelProbeLimit = 20;                 ///< Ceiling for channel capacity probing.
    std::string scpProgram = "scp";                     ///< Secure copy client.
    std::string sshpassProgram = "sshpass";             ///< Password feeder for scp.
};

/**
 * @brief An authenticated SSH connection with a pool of command channels.
 */
class RemoteSession : public RemoteShell, private ChannelFactory {
    struct Connected {
        explicit Connected() = default;
    };

public:
    /**
     * @brief Connects, verifies the host, authenticates and probes channel capacity.
     *
     * Any failure here is fatal to the remote run and is not retried.
     *
     * @param config Connection settings.
     * @param logger Operator log.
     * @return The open session or a descriptive error.
     */
    static std::expected<std::unique_ptr<RemoteSession>, std::string> open(const RemoteConfig& config, Logger& logger);

    /**
     * @brief Takes ownership of a connected libssh session. Only open() can call this.
     */
    RemoteSession(Connected, RemoteConfig config, Logger& logger, ssh_session_struct* session);
    ~RemoteSession() override;

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    std::expected<CommandResult, std::string> execute(const std::string& command) override;
    std::expected<void, std::string> runToFile(const std::string& command, const fs::path& localPath) override;
    std::expected<void, std::string> transferOut(const std::string& remotePath, const fs::path& localPath) override;

    /**
     * @brief Closes every pooled channel, then the connection. Safe to call repeatedly.
     */
    void close();

    std::size_t poolCapacity() const { return pool.capacity(); }

private:
    enum class AuthMethod { None, Key, Password };

    std::expected<void, std::string> verifyHost();
    std::expected<void, std::string> authenticate();
    std::expected<int, std::string> executeStreaming(const std::string& command, const OutputSink& onOutput, std::string& errorOutput);

    std::expected<std::unique_ptr<CommandChannel>, std::string> openChannel() override;

    RemoteConfig config;
    Logger& logger;
    ssh_session_struct* session; ///< libssh connection, nullptr once closed.
    AuthMethod authMethod = AuthMethod::None;
    std::mutex ioMutex;          ///< libssh sessions are not safe for concurrent use.
    SessionPool pool;
};

#endif // REMOTE_TRANSFER_HPP
