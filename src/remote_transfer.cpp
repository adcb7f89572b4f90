#include "remote_transfer.hpp"
#include "logger.hpp"
#include <libssh/libssh.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string sshError(ssh_session session) {
    const char* message = ssh_get_error(session);
    return message && *message ? message : "unknown libssh error";
}

/**
 * @brief One libssh channel, closed and freed on destruction.
 */
class LibsshChannel : public CommandChannel {
public:
    LibsshChannel(ssh_channel channel, ssh_session session) : channel(channel), session(session) {}

    ~LibsshChannel() override {
        if (ssh_channel_is_open(channel)) {
            ssh_channel_close(channel);
        }
        ssh_channel_free(channel);
    }

    std::expected<int, std::string> execute(const std::string& command, const OutputSink& onOutput,
                                            std::string& errorOutput, std::chrono::seconds timeout) override {
        used = true;
        if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
            return std::unexpected(fmt::format("Failed to start remote command: {}", sshError(session)));
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        char buf[16384];
        while (true) {
            int n = ssh_channel_read_timeout(channel, buf, sizeof(buf), 0, 200);
            if (n == SSH_ERROR) {
                return std::unexpected(fmt::format("Failed to read remote output: {}", sshError(session)));
            }
            if (n > 0 && onOutput && !onOutput(buf, static_cast<std::size_t>(n))) {
                return std::unexpected("Remote output could not be stored");
            }

            int e = ssh_channel_read_nonblocking(channel, buf, sizeof(buf), 1);
            if (e == SSH_ERROR) {
                return std::unexpected(fmt::format("Failed to read remote error output: {}", sshError(session)));
            }
            if (e > 0) {
                errorOutput.append(buf, static_cast<std::size_t>(e));
            }

            if (n <= 0 && e <= 0 && ssh_channel_is_eof(channel)) {
                break;
            }
            if (timeout.count() > 0 && std::chrono::steady_clock::now() > deadline) {
                return std::unexpected(fmt::format("Remote command timed out after {} seconds", timeout.count()));
            }
        }

        ssh_channel_send_eof(channel);
        int status = ssh_channel_get_exit_status(channel);
        ssh_channel_close(channel);
        if (status < 0) {
            return std::unexpected("Remote command ended without an exit status");
        }
        return status;
    }

    bool consumed() const override { return used; }

private:
    ssh_channel channel;
    ssh_session session;
    bool used = false;
};

// scp resolves relative paths against the login directory.
std::string scpPath(const std::string& remotePath) {
    if (remotePath.rfind("~/", 0) == 0) {
        return remotePath.substr(2);
    }
    return remotePath;
}

} // namespace

RemoteSession::RemoteSession(Connected, RemoteConfig config, Logger& logger, ssh_session_struct* session)
    : config(std::move(config)), logger(logger), session(session), pool(*this) {}

RemoteSession::~RemoteSession() {
    close();
}

std::expected<std::unique_ptr<RemoteSession>, std::string> RemoteSession::open(const RemoteConfig& config, Logger& logger) {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected("Failed to create SSH session");
    }
    int port = config.port;
    long timeout = static_cast<long>(config.connectTimeout.count());
    ssh_options_set(ssh, SSH_OPTIONS_HOST, config.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_USER, config.user.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);
    if (!config.knownHostsFile.empty()) {
        ssh_options_set(ssh, SSH_OPTIONS_KNOWNHOSTS, config.knownHostsFile.c_str());
    }

    logger.logMessage(fmt::format("Connecting to SSH server {}:{}...", config.host, config.port));
    if (ssh_connect(ssh) != SSH_OK) {
        std::string errorMsg = fmt::format("Unable to connect to SSH server {}:{}: {}", config.host, config.port, sshError(ssh));
        ssh_free(ssh);
        return std::unexpected(errorMsg);
    }

    auto remote = std::make_unique<RemoteSession>(Connected{}, config, logger, ssh);
    if (auto verified = remote->verifyHost(); !verified) {
        return std::unexpected(verified.error());
    }
    if (auto authenticated = remote->authenticate(); !authenticated) {
        return std::unexpected(authenticated.error());
    }
    logger.logMessage("Successfully connected to SSH server");

    logger.logMessage("Testing SSH channel capacity...");
    auto capacity = remote->pool.probe(config.channelProbeLimit);
    if (capacity == 0) {
        return std::unexpected(fmt::format("Unable to open a command channel on {}", config.host));
    }
    logger.logMessage(fmt::format("Maximum SSH channels: {}", capacity));
    return remote;
}

std::expected<void, std::string> RemoteSession::verifyHost() {
    if (config.hostKeyPolicy == HostKeyPolicy::AcceptAny) {
        logger.logWarning(fmt::format("Host key verification is disabled for {}", config.host));
        return {};
    }

    switch (ssh_session_is_known_server(session)) {
    case SSH_KNOWN_HOSTS_OK:
        return {};
    case SSH_KNOWN_HOSTS_CHANGED:
        return std::unexpected(fmt::format("Host key for {} has changed; refusing to connect", config.host));
    case SSH_KNOWN_HOSTS_OTHER:
        return std::unexpected(fmt::format("Host key type for {} does not match known_hosts; refusing to connect", config.host));
    case SSH_KNOWN_HOSTS_UNKNOWN:
    case SSH_KNOWN_HOSTS_NOT_FOUND:
        return std::unexpected(fmt::format("Host {} is not listed in known_hosts; add it or set host_key_policy to accept-any", config.host));
    default:
        return std::unexpected(fmt::format("Host key verification failed for {}: {}", config.host, sshError(session)));
    }
}

std::expected<void, std::string> RemoteSession::authenticate() {
    std::vector<std::string> failures;

    if (!config.keyPath.empty()) {
        logger.logMessage(fmt::format("Using SSH key: {}", config.keyPath));
        ssh_key key = nullptr;
        if (ssh_pki_import_privkey_file(config.keyPath.c_str(), nullptr, nullptr, nullptr, &key) != SSH_OK) {
            failures.push_back(fmt::format("unable to read private key {}", config.keyPath));
        } else {
            int rc = ssh_userauth_publickey(session, nullptr, key);
            ssh_key_free(key);
            if (rc == SSH_AUTH_SUCCESS) {
                authMethod = AuthMethod::Key;
                return {};
            }
            failures.push_back(fmt::format("key authentication refused: {}", sshError(session)));
        }
    }

    if (!config.password.empty()) {
        logger.logMessage("Using password authentication");
        if (ssh_userauth_password(session, nullptr, config.password.c_str()) == SSH_AUTH_SUCCESS) {
            authMethod = AuthMethod::Password;
            return {};
        }
        failures.push_back(fmt::format("password authentication refused: {}", sshError(session)));
    }

    if (failures.empty()) {
        failures.emplace_back("no key or password configured");
    }
    std::string detail;
    for (const auto& failure : failures) {
        detail += (detail.empty() ? "" : "; ") + failure;
    }
    return std::unexpected(fmt::format("SSH authentication failed for {}@{}: {}", config.user, config.host, detail));
}

std::expected<std::unique_ptr<CommandChannel>, std::string> RemoteSession::openChannel() {
    if (!session) {
        return std::unexpected("SSH session is closed");
    }
    ssh_channel channel = ssh_channel_new(session);
    if (!channel) {
        return std::unexpected(fmt::format("Failed to create channel: {}", sshError(session)));
    }
    if (ssh_channel_open_session(channel) != SSH_OK) {
        std::string errorMsg = fmt::format("Failed to open channel: {}", sshError(session));
        ssh_channel_free(channel);
        return std::unexpected(errorMsg);
    }
    return std::make_unique<LibsshChannel>(channel, session);
}

std::expected<int, std::string> RemoteSession::executeStreaming(const std::string& command, const OutputSink& onOutput,
                                                                std::string& errorOutput) {
    std::lock_guard<std::mutex> lock(ioMutex);
    auto channel = pool.acquire();
    if (!channel) {
        return std::unexpected(channel.error());
    }
    auto status = (*channel)->execute(command, onOutput, errorOutput, config.commandTimeout);
    pool.release(std::move(*channel));
    return status;
}

std::expected<CommandResult, std::string> RemoteSession::execute(const std::string& command) {
    CommandResult result;
    auto status = executeStreaming(command, [&result](const char* data, std::size_t size) {
        result.output.append(data, size);
        return true;
    }, result.errorOutput);
    if (!status) {
        return std::unexpected(status.error());
    }
    result.exitStatus = *status;
    return result;
}

std::expected<void, std::string> RemoteSession::runToFile(const std::string& command, const fs::path& localPath) {
    std::error_code ec;
    fs::create_directories(localPath.parent_path(), ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create local directory {}: {}", localPath.parent_path().string(), ec.message()));
    }

    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(fmt::format("Failed to create local file {}", localPath.string()));
    }
    std::string errorOutput;
    auto status = executeStreaming(command, [&out](const char* data, std::size_t size) {
        out.write(data, static_cast<std::streamsize>(size));
        return static_cast<bool>(out);
    }, errorOutput);
    out.close();

    if (!status || *status != 0 || !out) {
        fs::remove(localPath, ec);
        if (!status) {
            return std::unexpected(status.error());
        }
        if (*status != 0) {
            return std::unexpected(fmt::format("command failed with status {}, output: {}", *status, errorOutput));
        }
        return std::unexpected(fmt::format("Failed to write local file {}", localPath.string()));
    }
    return {};
}

std::expected<void, std::string> RemoteSession::transferOut(const std::string& remotePath, const fs::path& localPath) {
    std::vector<std::string> scpArgs = {
        config.scpProgram, "-q",
        "-P", std::to_string(config.port),
        "-o", config.hostKeyPolicy == HostKeyPolicy::AcceptAny ? "StrictHostKeyChecking=no" : "StrictHostKeyChecking=yes",
    };
    if (!config.knownHostsFile.empty()) {
        scpArgs.insert(scpArgs.end(), {"-o", "UserKnownHostsFile=" + config.knownHostsFile});
    }

    ProcessOptions options;
    options.timeout = config.commandTimeout;
    std::vector<std::string> argv;
    if (authMethod == AuthMethod::Password) {
        argv = {config.sshpassProgram, "-e"};
        options.environment.emplace_back("SSHPASS", config.password);
    } else {
        scpArgs.insert(scpArgs.end(), {"-o", "BatchMode=yes"});
        if (!config.keyPath.empty()) {
            scpArgs.insert(scpArgs.end(), {"-i", config.keyPath});
        }
    }
    argv.insert(argv.end(), scpArgs.begin(), scpArgs.end());
    argv.push_back(fmt::format("{}@{}:{}", config.user, config.host, scpPath(remotePath)));
    argv.push_back(localPath.string());

    std::error_code ec;
    fs::create_directories(localPath.parent_path(), ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create local directory {}: {}", localPath.parent_path().string(), ec.message()));
    }

    auto result = runProcess(argv, {}, options);
    if (!result) {
        return std::unexpected(fmt::format("scp failed: {}", result.error()));
    }
    if (!result->succeeded()) {
        fs::remove(localPath, ec);
        return std::unexpected(describeFailure("scp", *result));
    }
    return {};
}

void RemoteSession::close() {
    std::lock_guard<std::mutex> lock(ioMutex);
    pool.drain();
    if (session) {
        ssh_disconnect(session);
        ssh_free(session);
        session = nullptr;
    }
}
