/**
 * @file file_backup.hpp
 * @brief Tar.gz archive creation and extraction for site document roots.
 *
 * Packing (tar, pax-restricted format) and compression (gzip filter) are two layered
 * libarchive stages, so the compression filter can be swapped without touching the
 * tree walk.
 *
 * @note Symbolic links are neither archived nor followed. Restores therefore lose
 * symlinks; this is a known limitation of the archive format used here.
 *
 * @note Requires libarchive. On Linux install libarchive-dev or equivalent.
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <expected>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Options shared by archiving and change detection.
 */
struct ArchiveOptions {
    std::string excludedDirectory = "node_modules"; ///< Directory name never descended into. Empty disables.
};

/**
 * @brief Builds and unpacks deterministic tar.gz archives of a directory tree.
 */
class ArchiveEngine {
public:
    explicit ArchiveEngine(ArchiveOptions options = {});

    /**
     * @brief Archives a directory tree.
     *
     * Entries are written in sorted order with paths relative to the tree root.
     * Directories produce directory entries, regular files are streamed byte for byte,
     * and mode bits and modification times are kept in the entry headers. The archive
     * is written next to the destination as <destFile>.partial and renamed into place
     * only after libarchive has flushed and closed it.
     *
     * @param sourceTree Directory to archive.
     * @param destFile Final .tar.gz path.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> create(const fs::path& sourceTree, const fs::path& destFile) const;

    /**
     * @brief Unpacks an archive into a directory.
     *
     * Symlink entries are skipped. Parent directories are created on demand. Entries with
     * absolute paths or ".." components are rejected.
     *
     * @param archiveFile Path to a .tar.gz archive.
     * @param destDir Directory to extract into; created if missing.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> extract(const fs::path& archiveFile, const fs::path& destDir) const;

    /**
     * @brief Whether a directory entry with this name is skipped by walks over the tree.
     */
    bool isExcludedDirectory(const std::string& name) const;

    const ArchiveOptions& options() const { return options_; }

private:
    ArchiveOptions options_;
};

#endif // FILE_BACKUP_HPP
