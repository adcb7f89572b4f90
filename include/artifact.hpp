/**
 * @file artifact.hpp
 * @brief Backup artifact naming and on-disk layout for SiteVault.
 *
 * Every artifact carries a creation timestamp of the fixed form YYYY-MM-DD_HHMMSS
 * so that lexical and chronological ordering coincide. The layout is shared by the
 * local and remote modes:
 *
 *   <root>/<site>/files_<timestamp>.tar.gz
 *   <root>/<site>/database/db_<timestamp>.sql.gz
 */

#ifndef ARTIFACT_HPP
#define ARTIFACT_HPP

#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief The two artifact kinds produced per site.
 */
enum class ArtifactKind {
    Files,    ///< Compressed tar archive of the document root.
    Database  ///< Compressed SQL dump of the site database.
};

/**
 * @brief Whether artifacts are produced on this host or pulled from a remote one.
 */
enum class DeploymentMode {
    Local,
    Remote
};

const char* artifactKindName(ArtifactKind kind);
const char* deploymentModeName(DeploymentMode mode);

/**
 * @brief Formats a point in time as an artifact timestamp (local time, YYYY-MM-DD_HHMMSS).
 */
std::string artifactTimestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Builds an artifact file name such as files_2024-01-31_235959.tar.gz.
 */
std::string artifactFileName(ArtifactKind kind, const std::string& timestamp);

/**
 * @brief Extracts the creation time embedded in an artifact file name.
 *
 * @param fileName Bare file name (no directory part).
 * @param kind Kind whose prefix and suffix the name must carry.
 * @return The embedded time, or std::nullopt if the name is not an artifact of that kind.
 */
std::optional<std::time_t> parseArtifactTimestamp(const std::string& fileName, ArtifactKind kind);

/**
 * @brief Tells whether a bare file name is an artifact of the given kind.
 */
bool isArtifactName(const std::string& fileName, ArtifactKind kind);

/**
 * @brief Path arithmetic for one backup root.
 */
struct BackupLayout {
    fs::path root; ///< Backup root for one deployment mode.

    fs::path siteDirectory(const std::string& siteName) const;
    fs::path artifactDirectory(const std::string& siteName, ArtifactKind kind) const;
    fs::path artifactPath(const std::string& siteName, ArtifactKind kind, const std::string& timestamp) const;
};

/**
 * @brief Path an artifact is written to before it is renamed into place.
 */
fs::path partialPath(const fs::path& finalPath);

#endif // ARTIFACT_HPP
