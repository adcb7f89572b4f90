#include "backup_config.hpp"
#include <charconv>
#include <cstdlib>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace {

std::optional<long long> parseInteger(const std::string& text) {
    long long value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// libssh and scp take key paths literally.
std::string expandHome(const std::string& path) {
    if (path.rfind("~/", 0) != 0) {
        return path;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + path.substr(1) : path;
}

HostKeyPolicy parseHostKeyPolicy(const std::string& value) {
    if (value == "known-hosts") {
        return HostKeyPolicy::KnownHosts;
    }
    if (value == "accept-any") {
        return HostKeyPolicy::AcceptAny;
    }
    throw std::runtime_error(fmt::format("Invalid host_key_policy '{}': use known-hosts or accept-any", value));
}

RemoteTransferMode parseTransferMode(const std::string& value) {
    if (value == "scp") {
        return RemoteTransferMode::SecureCopy;
    }
    if (value == "stream") {
        return RemoteTransferMode::ChannelStream;
    }
    throw std::runtime_error(fmt::format("Invalid transfer_mode '{}': use scp or stream", value));
}

NotifyPolicy parseNotifyPolicy(const std::string& value) {
    if (value == "failure") {
        return NotifyPolicy::Failure;
    }
    if (value == "always") {
        return NotifyPolicy::Always;
    }
    throw std::runtime_error(fmt::format("Invalid notify_on '{}': use failure or always", value));
}

std::chrono::seconds readSeconds(const Json::Value& section, const char* key, std::chrono::seconds fallback) {
    if (!section.isMember(key)) {
        return fallback;
    }
    if (!section[key].isIntegral() || section[key].asInt64() < 0) {
        throw std::runtime_error(fmt::format("Invalid value for {}: expected a non-negative number of seconds", key));
    }
    return std::chrono::seconds(section[key].asInt64());
}

int readInt(const Json::Value& section, const char* key, int fallback) {
    if (!section.isMember(key)) {
        return fallback;
    }
    if (!section[key].isInt()) {
        throw std::runtime_error(fmt::format("Invalid value for {}: expected an integer", key));
    }
    return section[key].asInt();
}

} // namespace

BackupConfig::BackupConfig() = default;

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(fmt::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    if (!configJson.isObject()) {
        throw std::runtime_error(fmt::format("Config file {} must contain a JSON object", configFile));
    }

    logFile = configJson.get("log_file", logFile).asString();
    errorLogFile = configJson.get("error_log_file", errorLogFile).asString();
    if (configJson.isMember("apache_configs")) {
        apacheConfigFiles.clear();
        for (const auto& path : configJson["apache_configs"]) {
            apacheConfigFiles.push_back(path.asString());
        }
    }
    excludedDirectory = configJson.get("excluded_directory", excludedDirectory).asString();
    int parallel = readInt(configJson, "max_parallel_units", 0);
    if (parallel < 0) {
        throw std::runtime_error("max_parallel_units must not be negative");
    }
    maxParallelUnits = static_cast<std::size_t>(parallel);

    const Json::Value& local = configJson["local"];
    localBackupRoot = local.get("backup_root", localBackupRoot).asString();
    localRetention.maxFileBackups = readInt(local, "max_file_backups", localRetention.maxFileBackups);
    localRetention.maxDatabaseBackups = readInt(local, "max_db_backups", localRetention.maxDatabaseBackups);

    const Json::Value& database = configJson["database"];
    dumpOptions.program = database.get("dump_program", dumpOptions.program).asString();
    dumpOptions.timeout = readSeconds(database, "timeout", dumpOptions.timeout);

    const Json::Value& remoteJson = configJson["remote"];
    remoteEnabled = remoteJson.get("enabled", remoteEnabled).asBool();
    remoteBackupRoot = remoteJson.get("backup_root", remoteBackupRoot).asString();
    remoteRetention.maxFileBackups = readInt(remoteJson, "max_file_backups", remoteRetention.maxFileBackups);
    remoteRetention.maxDatabaseBackups = readInt(remoteJson, "max_db_backups", remoteRetention.maxDatabaseBackups);
    remote.host = remoteJson.get("host", remote.host).asString();
    remote.port = readInt(remoteJson, "port", remote.port);
    remote.user = remoteJson.get("user", remote.user).asString();
    remote.keyPath = expandHome(remoteJson.get("key_path", remote.keyPath).asString());
    remote.password = remoteJson.get("password", remote.password).asString();
    if (remoteJson.isMember("host_key_policy")) {
        remote.hostKeyPolicy = parseHostKeyPolicy(remoteJson["host_key_policy"].asString());
    }
    remote.knownHostsFile = expandHome(remoteJson.get("known_hosts_file", remote.knownHostsFile).asString());
    remote.connectTimeout = readSeconds(remoteJson, "connect_timeout", remote.connectTimeout);
    remote.commandTimeout = readSeconds(remoteJson, "command_timeout", remote.commandTimeout);
    int probeLimit = readInt(remoteJson, "channel_probe_limit", static_cast<int>(remote.channelProbeLimit));
    if (probeLimit < 1) {
        throw std::runtime_error("channel_probe_limit must be at least 1");
    }
    remote.channelProbeLimit = static_cast<std::size_t>(probeLimit);
    remote.scpProgram = remoteJson.get("scp_program", remote.scpProgram).asString();
    remote.sshpassProgram = remoteJson.get("sshpass_program", remote.sshpassProgram).asString();
    remoteOptions.tempDirectory = remoteJson.get("temp_dir", remoteOptions.tempDirectory).asString();
    if (remoteJson.isMember("transfer_mode")) {
        remoteOptions.transferMode = parseTransferMode(remoteJson["transfer_mode"].asString());
    }
    remoteOptions.oncePerDay = remoteJson.get("once_per_day", remoteOptions.oncePerDay).asBool();
    remoteOptions.excludedDirectory = excludedDirectory;

    telegramConfig = configJson["telegram"];
    if (configJson.isMember("notify_on")) {
        notifyOn = parseNotifyPolicy(configJson["notify_on"].asString());
    }
}

void BackupConfig::applyEnvironment(const EnvironmentLookup& lookup) {
    auto get = [&lookup](const char* name) -> const char* {
        return lookup ? lookup(name) : std::getenv(name);
    };
    auto overrideInt = [&get](const char* name, int& target) {
        if (const char* value = get(name)) {
            if (auto parsed = parseInteger(value)) {
                if (*parsed < std::numeric_limits<int>::min() || *parsed > std::numeric_limits<int>::max()) {
                    throw std::runtime_error(fmt::format("Environment variable {} is out of range: {}", name, value));
                }
                target = static_cast<int>(*parsed);
            }
        }
    };

    if (const char* value = get("REMOTE_BACKUP_ENABLED")) {
        remoteEnabled = std::string(value) == "true";
    }
    if (const char* value = get("SSH_HOST")) {
        remote.host = value;
    }
    if (const char* value = get("SSH_USER")) {
        remote.user = value;
    }
    overrideInt("SSH_PORT", remote.port);
    if (const char* value = get("SSH_KEY_PATH")) {
        remote.keyPath = expandHome(value);
    }
    if (const char* value = get("SSH_PASSWORD")) {
        remote.password = value;
    }
    if (const char* value = get("SSH_HOST_KEY_POLICY")) {
        remote.hostKeyPolicy = parseHostKeyPolicy(value);
    }
    overrideInt("LOCAL_MAX_FILE_BACKUPS", localRetention.maxFileBackups);
    overrideInt("LOCAL_MAX_DB_BACKUPS", localRetention.maxDatabaseBackups);
    overrideInt("REMOTE_MAX_FILE_BACKUPS", remoteRetention.maxFileBackups);
    overrideInt("REMOTE_MAX_DB_BACKUPS", remoteRetention.maxDatabaseBackups);

    validate();
}

void BackupConfig::validate() const {
    for (const auto& [name, policy] : {std::pair{"local", localRetention}, std::pair{"remote", remoteRetention}}) {
        if (policy.maxFileBackups < 1 || policy.maxDatabaseBackups < 1) {
            throw std::runtime_error(fmt::format("{} retention maxima must be at least 1 (files: {}, database: {})",
                                                 name, policy.maxFileBackups, policy.maxDatabaseBackups));
        }
    }
    if (localBackupRoot.empty()) {
        throw std::runtime_error("local.backup_root must not be empty");
    }
    if (!remoteEnabled) {
        return;
    }
    if (remote.host.empty() || remote.user.empty()) {
        throw std::runtime_error("Remote backup is enabled but remote host or user is missing");
    }
    if (remote.keyPath.empty() && remote.password.empty()) {
        throw std::runtime_error("Remote backup is enabled but neither key_path nor password is set");
    }
    if (remote.port < 1 || remote.port > 65535) {
        throw std::runtime_error(fmt::format("Invalid SSH port: {}", remote.port));
    }
    if (remoteBackupRoot.empty() || remoteOptions.tempDirectory.empty()) {
        throw std::runtime_error("remote.backup_root and remote.temp_dir must not be empty");
    }
}

bool BackupConfig::telegramEnabled() const {
    return telegramConfig.isObject() && !telegramConfig["bot_token"].asString().empty() &&
           !telegramConfig["chat_id"].asString().empty();
}
