#include "retention.hpp"
#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Candidate {
    fs::path path;
    fs::file_time_type modified;
};

} // namespace

RetentionManager::RetentionManager(BackupLayout layout, RetentionPolicy policy)
    : layout_(std::move(layout)), policy_(policy) {
    if (policy_.maxFileBackups < 1 || policy_.maxDatabaseBackups < 1) {
        throw std::invalid_argument(fmt::format("Retention maxima must be positive (files: {}, database: {})",
                                                policy_.maxFileBackups, policy_.maxDatabaseBackups));
    }
}

std::expected<std::size_t, std::string> RetentionManager::rotate(const std::string& siteName, ArtifactKind kind) const {
    auto directory = layout_.artifactDirectory(siteName, kind);
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return 0;
    }

    std::vector<Candidate> artifacts;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statError;
        if (!it->is_regular_file(statError) || !isArtifactName(it->path().filename().string(), kind)) {
            continue;
        }
        auto modified = fs::last_write_time(it->path(), statError);
        if (statError) {
            return std::unexpected(fmt::format("Failed to stat backup {}: {}", it->path().string(), statError.message()));
        }
        artifacts.push_back({it->path(), modified});
    }
    if (ec) {
        return std::unexpected(fmt::format("Failed to list backups in {}: {}", directory.string(), ec.message()));
    }

    auto maxKept = static_cast<std::size_t>(policy_.maxKept(kind));
    if (artifacts.size() <= maxKept) {
        return 0;
    }

    std::sort(artifacts.begin(), artifacts.end(), [](const Candidate& a, const Candidate& b) {
        if (a.modified != b.modified) {
            return a.modified > b.modified;
        }
        return a.path.filename() > b.path.filename();
    });

    std::size_t removed = 0;
    std::vector<std::string> failures;
    for (std::size_t i = maxKept; i < artifacts.size(); ++i) {
        std::error_code removeError;
        if (fs::remove(artifacts[i].path, removeError)) {
            ++removed;
        } else {
            failures.push_back(fmt::format("{} ({})", artifacts[i].path.string(),
                                           removeError ? removeError.message() : "already gone"));
        }
    }

    if (!failures.empty()) {
        return std::unexpected(fmt::format("Failed to remove old backups: {}", fmt::join(failures, "; ")));
    }
    return removed;
}
