/**
 * @file retention.hpp
 * @brief Count-based rotation of backup artifacts.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <cstddef>
#include <expected>
#include <string>
#include "artifact.hpp"

/**
 * @brief How many artifacts of each kind a site keeps.
 */
struct RetentionPolicy {
    int maxFileBackups = 5;      ///< Archives kept per site.
    int maxDatabaseBackups = 20; ///< Dumps kept per site.

    int maxKept(ArtifactKind kind) const {
        return kind == ArtifactKind::Files ? maxFileBackups : maxDatabaseBackups;
    }
};

/**
 * @brief Keeps the N most recent artifacts of a kind and deletes the rest.
 */
class RetentionManager {
public:
    /**
     * @brief Constructs a retention manager for one backup root.
     *
     * @param layout Backup root the artifacts live under.
     * @param policy Per-kind maxima, each at least 1.
     * @throws std::invalid_argument If a maximum is below 1.
     */
    RetentionManager(BackupLayout layout, RetentionPolicy policy);

    /**
     * @brief Rotates one kind of artifact for one site.
     *
     * Artifacts are ordered by modification time, newest first, with the file name as
     * tie breaker. Everything past the configured maximum is deleted. Deletion is
     * best effort: every surplus artifact is attempted and all failures are reported
     * together.
     *
     * @return Number of artifacts deleted, or the collected deletion errors.
     */
    std::expected<std::size_t, std::string> rotate(const std::string& siteName, ArtifactKind kind) const;

    const RetentionPolicy& policy() const { return policy_; }

private:
    BackupLayout layout_;
    RetentionPolicy policy_;
};

#endif // RETENTION_HPP
