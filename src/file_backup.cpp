/**
 * @file file_backup.cpp
 * @brief Tar.gz archive engine implementation for SiteVault.
 *
 * Sorted, symlink-free tree walk feeding a libarchive pax writer with a gzip filter.
 */

#include "file_backup.hpp"
#include "artifact.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using EntryPtr = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

std::expected<void, std::string> writeHeader(struct archive* a, const fs::path& relative, const struct stat& st) {
    EntryPtr entry(archive_entry_new(), &archive_entry_free);
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), relative.generic_string().c_str());
    if (S_ISDIR(st.st_mode)) {
        archive_entry_set_size(entry.get(), 0);
    }
    if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) {
        return std::unexpected(fmt::format("Failed to write tar header for {}: {}", relative.string(), archiveError(a)));
    }
    return {};
}

std::expected<void, std::string> writeFileData(struct archive* a, const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(fmt::format("Failed to open file: {} (error: {})", path.string(), strerror(errno)));
    }

    char buf[8192];
    while (file) {
        file.read(buf, sizeof(buf));
        auto count = file.gcount();
        if (count > 0 && archive_write_data(a, buf, static_cast<size_t>(count)) < 0) {
            return std::unexpected(fmt::format("Failed to write file content for {}: {}", path.string(), archiveError(a)));
        }
    }
    if (file.bad()) {
        return std::unexpected(fmt::format("Failed to read file: {}", path.string()));
    }
    return {};
}

std::expected<void, std::string> writeDirectory(struct archive* a, const fs::path& root, const fs::path& relative,
                                                const ArchiveEngine& engine) {
    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(root / relative, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return std::unexpected(fmt::format("Failed to read directory {}: {}", (root / relative).string(), ec.message()));
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        auto name = child.filename();
        auto childRelative = relative / name;

        struct stat st;
        if (::lstat(child.c_str(), &st) != 0) {
            return std::unexpected(fmt::format("Failed to stat {}: {}", child.string(), strerror(errno)));
        }

        if (S_ISLNK(st.st_mode)) {
            continue;
        }
        if (S_ISDIR(st.st_mode)) {
            if (engine.isExcludedDirectory(name.string())) {
                continue;
            }
            if (auto r = writeHeader(a, childRelative, st); !r) {
                return r;
            }
            if (auto r = writeDirectory(a, root, childRelative, engine); !r) {
                return r;
            }
        } else if (S_ISREG(st.st_mode)) {
            if (auto r = writeHeader(a, childRelative, st); !r) {
                return r;
            }
            if (auto r = writeFileData(a, child); !r) {
                return r;
            }
        }
        // Sockets, FIFOs and device nodes are not part of a site backup.
    }
    return {};
}

bool isSafeRelative(const fs::path& relative) {
    if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        return false;
    }
    return std::none_of(relative.begin(), relative.end(), [](const fs::path& part) { return part == ".."; });
}

} // namespace

ArchiveEngine::ArchiveEngine(ArchiveOptions options) : options_(std::move(options)) {}

bool ArchiveEngine::isExcludedDirectory(const std::string& name) const {
    return !options_.excludedDirectory.empty() && name == options_.excludedDirectory;
}

std::expected<void, std::string> ArchiveEngine::create(const fs::path& sourceTree, const fs::path& destFile) const {
    std::error_code ec;
    if (!fs::is_directory(sourceTree, ec)) {
        return std::unexpected(fmt::format("Source directory does not exist: {}", sourceTree.string()));
    }
    fs::create_directories(destFile.parent_path(), ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create backup directory {}: {}", destFile.parent_path().string(), ec.message()));
    }

    auto partial = partialPath(destFile);
    ArchiveWriter a(archive_write_new(), &archive_write_free);
    archive_write_add_filter_gzip(a.get());
    archive_write_set_format_pax_restricted(a.get());
    if (archive_write_open_filename(a.get(), partial.c_str()) != ARCHIVE_OK) {
        std::string errorMsg = fmt::format("Failed to open archive file: {} (error: {})", partial.string(), archiveError(a.get()));
        a.reset();
        fs::remove(partial, ec);
        return std::unexpected(errorMsg);
    }

    auto written = writeDirectory(a.get(), sourceTree, fs::path(), *this);
    if (written && archive_write_close(a.get()) != ARCHIVE_OK) {
        written = std::unexpected(fmt::format("Failed to finish archive {}: {}", partial.string(), archiveError(a.get())));
    }
    a.reset();

    if (!written) {
        fs::remove(partial, ec);
        return written;
    }

    fs::rename(partial, destFile, ec);
    if (ec) {
        std::string errorMsg = fmt::format("Failed to move archive into place {}: {}", destFile.string(), ec.message());
        fs::remove(partial, ec);
        return std::unexpected(errorMsg);
    }
    return {};
}

std::expected<void, std::string> ArchiveEngine::extract(const fs::path& archiveFile, const fs::path& destDir) const {
    ArchiveReader a(archive_read_new(), &archive_read_free);
    archive_read_support_filter_all(a.get());
    archive_read_support_format_tar(a.get());
    if (archive_read_open_filename(a.get(), archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected(fmt::format("Failed to open archive: {} (error: {})", archiveFile.string(), archiveError(a.get())));
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create directory {}: {}", destDir.string(), ec.message()));
    }

    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        auto type = archive_entry_filetype(entry);
        const char* name = archive_entry_pathname(entry);
        if (type == AE_IFLNK || name == nullptr) {
            archive_read_data_skip(a.get());
            continue;
        }

        auto relative = fs::path(name).lexically_normal();
        if (relative.empty() || relative == ".") {
            archive_read_data_skip(a.get());
            continue;
        }
        if (!isSafeRelative(relative)) {
            return std::unexpected(fmt::format("Refusing unsafe archive entry: {}", name));
        }
        auto target = destDir / relative;

        if (type == AE_IFDIR) {
            fs::create_directories(target, ec);
            if (ec) {
                return std::unexpected(fmt::format("Failed to create directory {}: {}", target.string(), ec.message()));
            }
        } else if (type == AE_IFREG) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return std::unexpected(fmt::format("Failed to create directory {}: {}", target.parent_path().string(), ec.message()));
            }
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out) {
                return std::unexpected(fmt::format("Failed to create file: {} (error: {})", target.string(), strerror(errno)));
            }
            char buf[8192];
            la_ssize_t n;
            while ((n = archive_read_data(a.get(), buf, sizeof(buf))) > 0) {
                out.write(buf, n);
            }
            if (n < 0) {
                return std::unexpected(fmt::format("Failed to read {} from archive: {}", name, archiveError(a.get())));
            }
            out.close();
            if (!out) {
                return std::unexpected(fmt::format("Failed to write file: {}", target.string()));
            }
        } else {
            archive_read_data_skip(a.get());
        }
    }

    if (r != ARCHIVE_EOF) {
        return std::unexpected(fmt::format("Failed to read tar header from {}: {}", archiveFile.string(), archiveError(a.get())));
    }
    return {};
}
