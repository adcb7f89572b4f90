/**
 * @file site.hpp
 * @brief The backup target model: one web application deployment.
 */

#ifndef SITE_HPP
#define SITE_HPP

#include <expected>
#include <string>

/**
 * @brief Database connection tuple read from a site's environment file.
 */
struct DatabaseConfig {
    std::string host;     ///< Database host. Empty means localhost.
    std::string name;     ///< Database name.
    std::string user;     ///< Database user.
    std::string password; ///< Database password, may be empty.

    /**
     * @brief Whether enough is known to run a dump (name and user present).
     */
    bool usable() const { return !name.empty() && !user.empty(); }

    /**
     * @brief Whether any field was found at all.
     */
    bool empty() const { return host.empty() && name.empty() && user.empty() && password.empty(); }

    /**
     * @brief Host to connect to, defaulting to localhost.
     */
    std::string effectiveHost() const { return host.empty() ? "localhost" : host; }
};

/**
 * @brief One discovered deployment. Immutable after discovery.
 *
 * Identity is (serverName, documentRoot). The server name has already been
 * validated for use as a single path component.
 */
struct Site {
    std::string serverName;   ///< Virtual host name, safe as a directory name.
    std::string documentRoot; ///< Absolute document root.
    DatabaseConfig database;  ///< Empty when no environment file was found.
};

/**
 * @brief Validates a server name for use as a directory name under the backup root.
 *
 * Characters outside [A-Za-z0-9._-] are replaced by '_'. Names that are empty or
 * reduce to "." or ".." are rejected.
 *
 * @return The directory-safe name or an error message.
 */
std::expected<std::string, std::string> sanitizeSiteName(const std::string& serverName);

#endif // SITE_HPP
