#include "site_directory.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kEnvironmentLocations = {
    ".env",
    "../.env",
    "../../.env",
    "../../../.env",
    "public/.env",
    "public_html/.env",
    "html/.env",
    "app/.env",
    "laravel/.env",
};

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string stripQuotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Splits "Directive   value ..." into a lower-cased directive and the trimmed remainder.
std::pair<std::string, std::string> splitDirective(const std::string& line) {
    auto space = line.find_first_of(" \t");
    if (space == std::string::npos) {
        return {toLower(line), {}};
    }
    return {toLower(line.substr(0, space)), trim(line.substr(space + 1))};
}

std::string documentRootValue(const std::string& value) {
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        auto close = value.find(value.front(), 1);
        if (close != std::string::npos) {
            return value.substr(1, close - 1);
        }
        return value.substr(1);
    }
    return value;
}

// FNV-1a, so a suffixed site keeps the same backup directory from run to run.
std::uint32_t rootDigest(const std::string& documentRoot) {
    std::uint32_t hash = 2166136261u;
    for (unsigned char c : documentRoot) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

} // namespace

const char* readErrorName(ReadError error) {
    return error == ReadError::NotFound ? "not found" : "unreadable";
}

std::expected<std::string, std::string> sanitizeSiteName(const std::string& serverName) {
    std::string name = trim(serverName);
    for (auto& c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '-' && c != '_') {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..") {
        return std::unexpected(fmt::format("Invalid server name for a backup directory: '{}'", serverName));
    }
    return name;
}

LocalConfigSource::LocalConfigSource(std::vector<std::string> configPaths)
    : configPaths(std::move(configPaths)) {}

std::vector<std::string> LocalConfigSource::configFiles() {
    return configPaths;
}

std::expected<std::string, ReadError> LocalConfigSource::readFile(const std::string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(ReadError::NotFound);
    }
    if (!fs::is_regular_file(status)) {
        return std::unexpected(ReadError::Unreadable);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(ReadError::Unreadable);
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(ReadError::Unreadable);
    }
    return content.str();
}

SiteDirectory::SiteDirectory(Logger& logger) : logger(logger) {}

std::vector<VirtualHost> SiteDirectory::parseVirtualHosts(const std::string& configText) {
    std::vector<VirtualHost> hosts;
    std::string currentServerName;

    std::istringstream lines(configText);
    std::string rawLine;
    while (std::getline(lines, rawLine)) {
        std::string line = trim(rawLine);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto lower = toLower(line);
        if (lower.rfind("<virtualhost", 0) == 0 || lower.rfind("</virtualhost", 0) == 0) {
            currentServerName.clear();
            continue;
        }

        auto [directive, value] = splitDirective(line);
        if (directive == "servername" && !value.empty()) {
            std::istringstream tokens(value);
            std::string name;
            tokens >> name;
            currentServerName = stripQuotes(name);
        } else if (directive == "documentroot" && !value.empty() && !currentServerName.empty()) {
            hosts.push_back({currentServerName, documentRootValue(value)});
            currentServerName.clear();
        }
    }
    return hosts;
}

DatabaseConfig SiteDirectory::parseEnvironment(const std::string& envText) {
    DatabaseConfig config;
    bool haveHost = false, haveName = false, haveUser = false, havePassword = false;

    std::istringstream lines(envText);
    std::string rawLine;
    while (std::getline(lines, rawLine)) {
        std::string line = trim(rawLine);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = stripQuotes(trim(line.substr(eq + 1)));

        if (key == "DB_HOST" && !haveHost) {
            config.host = value;
            haveHost = true;
        } else if (key == "DB_DATABASE" && !haveName) {
            config.name = value;
            haveName = true;
        } else if (key == "DB_USERNAME" && !haveUser) {
            config.user = value;
            haveUser = true;
        } else if (key == "DB_PASSWORD" && !havePassword) {
            config.password = value;
            havePassword = true;
        }
    }
    return config;
}

std::vector<std::string> SiteDirectory::environmentCandidates(const std::string& documentRoot) {
    std::vector<std::string> candidates;
    for (const auto& location : kEnvironmentLocations) {
        auto candidate = (fs::path(documentRoot) / location).lexically_normal().string();
        if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(candidate);
        }
    }
    return candidates;
}

std::expected<DatabaseConfig, ReadError> SiteDirectory::locateEnvironment(ConfigSource& source, const std::string& documentRoot) {
    bool sawUnreadable = false;
    for (const auto& candidate : environmentCandidates(documentRoot)) {
        auto content = source.readFile(candidate);
        if (content) {
            return parseEnvironment(*content);
        }
        if (content.error() == ReadError::Unreadable) {
            logger.logWarning(fmt::format("Environment file exists but is unreadable: {}", candidate));
            sawUnreadable = true;
        }
    }
    return std::unexpected(sawUnreadable ? ReadError::Unreadable : ReadError::NotFound);
}

std::vector<Site> SiteDirectory::discover(ConfigSource& source) {
    std::vector<Site> sites;
    std::map<std::string, std::string> rootByName;

    for (const auto& configFile : source.configFiles()) {
        auto content = source.readFile(configFile);
        if (!content) {
            logger.logWarning(fmt::format("Failed to read config {}: {}", configFile, readErrorName(content.error())));
            continue;
        }

        for (const auto& host : parseVirtualHosts(*content)) {
            auto name = sanitizeSiteName(host.serverName);
            if (!name) {
                logger.logWarning(fmt::format("Skipping site at {}: {}", host.documentRoot, name.error()));
                continue;
            }
            if (!fs::path(host.documentRoot).is_absolute()) {
                logger.logWarning(fmt::format("Skipping site {}: document root is not absolute: {}", *name, host.documentRoot));
                continue;
            }
            auto siteName = *name;
            if (auto owner = rootByName.find(siteName); owner != rootByName.end()) {
                if (owner->second == host.documentRoot) {
                    continue;
                }
                siteName = fmt::format("{}-{:08x}", *name, rootDigest(host.documentRoot));
                if (auto suffixed = rootByName.find(siteName); suffixed != rootByName.end()) {
                    if (suffixed->second != host.documentRoot) {
                        logger.logError(fmt::format("Skipping site {} at {}: backup name {} is already taken by {}", host.serverName,
                                                    host.documentRoot, siteName, suffixed->second));
                    }
                    continue;
                }
                logger.logWarning(fmt::format("Site name {} is already used by {}; backing up {} as {}", *name, owner->second,
                                              host.documentRoot, siteName));
            }
            rootByName.emplace(siteName, host.documentRoot);

            Site site{siteName, host.documentRoot, {}};
            auto database = locateEnvironment(source, host.documentRoot);
            if (database) {
                site.database = *database;
            } else {
                logger.logMessage(fmt::format("No database configuration for {} (environment file {})", site.serverName, readErrorName(database.error())));
            }
            logger.logMessage(fmt::format("Found site: {} at {}", site.serverName, site.documentRoot));
            sites.push_back(std::move(site));
        }
    }
    return sites;
}
