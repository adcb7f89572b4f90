#include "artifact.hpp"
#include <fmt/format.h>
#include <iomanip>
#include <sstream>

namespace {

constexpr const char* kTimestampFormat = "%Y-%m-%d_%H%M%S";
constexpr std::size_t kTimestampLength = 17; // YYYY-MM-DD_HHMMSS

struct NamePattern {
    const char* prefix;
    const char* suffix;
};

NamePattern patternFor(ArtifactKind kind) {
    return kind == ArtifactKind::Files ? NamePattern{"files_", ".tar.gz"} : NamePattern{"db_", ".sql.gz"};
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char* artifactKindName(ArtifactKind kind) {
    return kind == ArtifactKind::Files ? "files" : "database";
}

const char* deploymentModeName(DeploymentMode mode) {
    return mode == DeploymentMode::Local ? "local" : "remote";
}

std::string artifactTimestamp(std::chrono::system_clock::time_point when) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char buf[32];
    std::strftime(buf, sizeof(buf), kTimestampFormat, &tmLocal);
    return buf;
}

std::string artifactFileName(ArtifactKind kind, const std::string& timestamp) {
    auto pattern = patternFor(kind);
    return fmt::format("{}{}{}", pattern.prefix, timestamp, pattern.suffix);
}

std::optional<std::time_t> parseArtifactTimestamp(const std::string& fileName, ArtifactKind kind) {
    auto pattern = patternFor(kind);
    if (!startsWith(fileName, pattern.prefix) || !endsWith(fileName, pattern.suffix)) {
        return std::nullopt;
    }
    std::string prefix = pattern.prefix;
    std::string suffix = pattern.suffix;
    if (fileName.size() != prefix.size() + kTimestampLength + suffix.size()) {
        return std::nullopt;
    }

    std::tm tmLocal{};
    std::istringstream ss(fileName.substr(prefix.size(), kTimestampLength));
    ss >> std::get_time(&tmLocal, kTimestampFormat);
    if (ss.fail()) {
        return std::nullopt;
    }
    tmLocal.tm_isdst = -1;
    std::time_t parsed = std::mktime(&tmLocal);
    if (parsed == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return parsed;
}

bool isArtifactName(const std::string& fileName, ArtifactKind kind) {
    return parseArtifactTimestamp(fileName, kind).has_value();
}

fs::path BackupLayout::siteDirectory(const std::string& siteName) const {
    return root / siteName;
}

fs::path BackupLayout::artifactDirectory(const std::string& siteName, ArtifactKind kind) const {
    return kind == ArtifactKind::Files ? siteDirectory(siteName) : siteDirectory(siteName) / "database";
}

fs::path BackupLayout::artifactPath(const std::string& siteName, ArtifactKind kind, const std::string& timestamp) const {
    return artifactDirectory(siteName, kind) / artifactFileName(kind, timestamp);
}

fs::path partialPath(const fs::path& finalPath) {
    fs::path partial = finalPath;
    partial += ".partial";
    return partial;
}
