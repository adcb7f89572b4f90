#include "change_detector.hpp"
#include "file_backup.hpp"
#include "logger.hpp"
#include "remote_shell.hpp"
#include <chrono>
#include <fmt/format.h>
#include <functional>
#include <sstream>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Extraction target that is removed when the comparison ends.
 */
class ScratchDirectory {
public:
    ScratchDirectory(fs::path path, Logger& logger) : path_(std::move(path)), logger(logger) {}

    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            logger.logWarning(fmt::format("Failed to remove scratch directory {}: {}", path_.string(), ec.message()));
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    Logger& logger;
};

using EntryVisitor = std::function<bool(const fs::path&, const fs::file_status&)>;

// Visits directories and regular files below root with the archive's exclusion rules.
// The visitor returns false to stop the walk early.
std::expected<std::size_t, std::string> walkTree(const fs::path& root, const ArchiveEngine& engine, const EntryVisitor& visit) {
    std::error_code ec;
    std::size_t visited = 0;
    fs::recursive_directory_iterator it(root, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        auto status = it->symlink_status(ec);
        if (ec) {
            break;
        }
        if (fs::is_symlink(status)) {
            continue;
        }
        if (fs::is_directory(status)) {
            if (engine.isExcludedDirectory(it->path().filename().string())) {
                it.disable_recursion_pending();
                continue;
            }
        } else if (!fs::is_regular_file(status)) {
            continue;
        }

        ++visited;
        if (visit && !visit(it->path(), status)) {
            return visited;
        }
    }
    if (ec) {
        return std::unexpected(fmt::format("Failed to walk {}: {}", root.string(), ec.message()));
    }
    return visited;
}

std::time_t modifiedSeconds(fs::file_time_type modified) {
    auto sys = std::chrono::file_clock::to_sys(modified);
    return static_cast<std::time_t>(std::chrono::floor<std::chrono::seconds>(sys).time_since_epoch().count());
}

} // namespace

ChangeDetector::ChangeDetector(BackupLayout layout, const ArchiveEngine& engine, Logger& logger)
    : layout(std::move(layout)), engine(engine), logger(logger) {}

std::optional<fs::path> ChangeDetector::latestArchive(const std::string& siteName) const {
    std::optional<fs::path> latest;
    std::time_t latestTime = 0;
    std::error_code ec;
    for (fs::directory_iterator it(layout.artifactDirectory(siteName, ArtifactKind::Files), ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code statError;
        if (!it->is_regular_file(statError)) {
            continue;
        }
        auto name = it->path().filename().string();
        auto created = parseArtifactTimestamp(name, ArtifactKind::Files);
        if (!created) {
            continue;
        }
        if (!latest || *created > latestTime || (*created == latestTime && name > latest->filename().string())) {
            latest = it->path();
            latestTime = *created;
        }
    }
    return latest;
}

std::expected<bool, std::string> ChangeDetector::hasChanged(const std::string& siteName, const fs::path& sourceTree) const {
    auto latest = latestArchive(siteName);
    if (!latest) {
        return true;
    }
    auto archiveTime = parseArtifactTimestamp(latest->filename().string(), ArtifactKind::Files).value_or(0);

    auto scratchName = fmt::format(".scratch_{}", std::chrono::steady_clock::now().time_since_epoch().count());
    ScratchDirectory scratch(layout.siteDirectory(siteName) / scratchName, logger);
    if (auto extracted = engine.extract(*latest, scratch.path()); !extracted) {
        logger.logWarning(fmt::format("Previous archive {} is unreadable, backing up {} again: {}",
                                      latest->string(), siteName, extracted.error()));
        return true;
    }

    bool changed = false;
    auto walked = walkTree(sourceTree, engine, [&](const fs::path& path, const fs::file_status& status) {
        auto snapshotPath = scratch.path() / path.lexically_relative(sourceTree);
        std::error_code ec;
        auto snapshotStatus = fs::symlink_status(snapshotPath, ec);
        if (ec || !fs::exists(snapshotStatus)) {
            changed = true;
        } else if (fs::is_directory(status) != fs::is_directory(snapshotStatus) ||
                   fs::is_regular_file(status) != fs::is_regular_file(snapshotStatus)) {
            changed = true;
        } else if (fs::is_regular_file(status)) {
            auto size = fs::file_size(path, ec);
            auto snapshotSize = ec ? 0 : fs::file_size(snapshotPath, ec);
            auto modified = ec ? fs::file_time_type{} : fs::last_write_time(path, ec);
            changed = ec || size != snapshotSize || modifiedSeconds(modified) > archiveTime;
        }
        return !changed;
    });
    if (!walked) {
        return std::unexpected(walked.error());
    }
    if (changed) {
        return true;
    }

    auto snapshotEntries = walkTree(scratch.path(), engine, {});
    if (!snapshotEntries) {
        return std::unexpected(snapshotEntries.error());
    }
    return *snapshotEntries > *walked;
}

RemoteChangeDetector::RemoteChangeDetector(RemoteShell& shell, std::string excludedDirectory)
    : shell(shell), excludedDirectory(std::move(excludedDirectory)) {}

std::expected<bool, std::string> RemoteChangeDetector::hasChanged(const std::string& sourceTree) {
    std::string exclusion;
    if (!excludedDirectory.empty()) {
        exclusion = fmt::format(" -not -path {}", shellQuote("*/" + excludedDirectory + "/*"));
    }
    auto output = shell.run(fmt::format("find {} -type f -mtime -1 -not -path '*/.*'{} | wc -l",
                                        shellPath(sourceTree), exclusion));
    if (!output) {
        return std::unexpected(fmt::format("Failed to check for changes in {}: {}", sourceTree, output.error()));
    }

    std::istringstream ss(*output);
    long long count = 0;
    if (!(ss >> count)) {
        return std::unexpected(fmt::format("Unexpected change count for {}: {}", sourceTree, *output));
    }
    return count > 0;
}
