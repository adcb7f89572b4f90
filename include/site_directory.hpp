/**
 * @file site_directory.hpp
 * @brief Discovery of backup targets from web server configuration.
 *
 * Virtual host configuration is scanned for ServerName/DocumentRoot pairs. For every
 * site an environment file is searched near the document root and its database
 * credentials are extracted. The configuration itself is read through a ConfigSource,
 * so the same parser serves the local host and a remote shell.
 */

#ifndef SITE_DIRECTORY_HPP
#define SITE_DIRECTORY_HPP

#include <expected>
#include <string>
#include <vector>
#include "site.hpp"

class Logger;

/**
 * @brief Why a configuration or environment file could not be read.
 */
enum class ReadError {
    NotFound,  ///< No file at that path.
    Unreadable ///< The file exists but could not be read.
};

const char* readErrorName(ReadError error);

/**
 * @brief Read-only access to configuration text, local or remote.
 */
class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    /**
     * @brief Lists the virtual host configuration files to scan, in scan order.
     */
    virtual std::vector<std::string> configFiles() = 0;

    /**
     * @brief Reads a whole text file.
     */
    virtual std::expected<std::string, ReadError> readFile(const std::string& path) = 0;
};

/**
 * @brief ConfigSource over the local filesystem with a fixed list of configuration files.
 */
class LocalConfigSource : public ConfigSource {
public:
    explicit LocalConfigSource(std::vector<std::string> configPaths);

    std::vector<std::string> configFiles() override;
    std::expected<std::string, ReadError> readFile(const std::string& path) override;

private:
    std::vector<std::string> configPaths;
};

/**
 * @brief A (name, root) pair found in configuration text, before validation.
 */
struct VirtualHost {
    std::string serverName;
    std::string documentRoot;
};

/**
 * @brief Turns web server configuration into a de-duplicated set of sites.
 */
class SiteDirectory {
public:
    explicit SiteDirectory(Logger& logger);

    /**
     * @brief Discovers every site reachable through the source.
     *
     * Unreadable configuration files and invalid server names are logged and skipped.
     * A missing or unreadable environment file leaves the database fields empty.
     * Site names are unique in the result: when a sanitized name is already taken by
     * another document root, the later site gets a "-xxxxxxxx" suffix derived from its root.
     *
     * @param source Where configuration and environment files are read from.
     * @return Sites in discovery order, one per distinct (name, root) pair.
     */
    std::vector<Site> discover(ConfigSource& source);

    /**
     * @brief Finds and parses the environment file belonging to a document root.
     *
     * @return Credentials from the first existing, readable candidate; NotFound when no
     *         candidate exists; Unreadable when candidates exist but none could be read.
     */
    std::expected<DatabaseConfig, ReadError> locateEnvironment(ConfigSource& source, const std::string& documentRoot);

    /**
     * @brief Extracts (name, root) pairs from one configuration fragment.
     *
     * ServerName and DocumentRoot are matched case-insensitively. A DocumentRoot only
     * pairs with a ServerName seen earlier in the same block; the name is consumed by
     * the pairing. Block markers and the start of the fragment reset the pending name.
     */
    static std::vector<VirtualHost> parseVirtualHosts(const std::string& configText);

    /**
     * @brief Extracts DB_HOST, DB_DATABASE, DB_USERNAME and DB_PASSWORD from KEY=VALUE text.
     *
     * Values are trimmed and lose one layer of matching quotes. The first occurrence
     * of a key wins; comments, unknown keys and malformed lines are ignored.
     */
    static DatabaseConfig parseEnvironment(const std::string& envText);

    /**
     * @brief Candidate environment file paths for a document root, in lookup order.
     */
    static std::vector<std::string> environmentCandidates(const std::string& documentRoot);

private:
    Logger& logger;
};

#endif // SITE_DIRECTORY_HPP
