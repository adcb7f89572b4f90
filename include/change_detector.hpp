/**
 * @file change_detector.hpp
 * @brief Decides whether a site's document root needs a fresh archive.
 *
 * Two policies exist. ChangeDetector compares the live tree against the newest
 * archive it finds under the backup root and is exact up to whole seconds.
 * RemoteChangeDetector only asks the remote host whether any file was modified in
 * the last 24 hours; it costs one round trip but can miss older edits and can report
 * a change for a tree that was already archived today.
 */

#ifndef CHANGE_DETECTOR_HPP
#define CHANGE_DETECTOR_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include "artifact.hpp"

namespace fs = std::filesystem;

class ArchiveEngine;
class Logger;
class RemoteShell;

/**
 * @brief Snapshot comparison against the most recent local file archive.
 */
class ChangeDetector {
public:
    ChangeDetector(BackupLayout layout, const ArchiveEngine& engine, Logger& logger);

    /**
     * @brief Reports whether the source tree differs from its last archive.
     *
     * The newest files_<timestamp>.tar.gz is extracted into a scratch directory under the
     * site directory, which is removed again before returning. The tree counts as changed
     * when it has no archive yet, when the archive cannot be read, when a path is missing
     * from the snapshot or has a different type, when a regular file differs in size or
     * was modified after the archive timestamp, and when the snapshot holds entries the
     * tree no longer has. Symlinks and the excluded directory are ignored.
     *
     * @param siteName Directory-safe site name.
     * @param sourceTree Document root to compare.
     * @return true if a new archive is needed, or an error if the tree cannot be walked.
     */
    std::expected<bool, std::string> hasChanged(const std::string& siteName, const fs::path& sourceTree) const;

    /**
     * @brief Finds the newest file archive of a site by its embedded timestamp.
     */
    std::optional<fs::path> latestArchive(const std::string& siteName) const;

private:
    BackupLayout layout;
    const ArchiveEngine& engine;
    Logger& logger;
};

/**
 * @brief Coarse remote check: any file modified within the last day.
 */
class RemoteChangeDetector {
public:
    RemoteChangeDetector(RemoteShell& shell, std::string excludedDirectory);

    /**
     * @brief Counts regular files under the remote tree modified in the last 24 hours.
     *
     * Hidden paths and the excluded directory are not counted.
     *
     * @return true when at least one such file exists.
     */
    std::expected<bool, std::string> hasChanged(const std::string& sourceTree);

private:
    RemoteShell& shell;
    std::string excludedDirectory;
};

#endif // CHANGE_DETECTOR_HPP
