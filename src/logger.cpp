#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string logTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmLocal);
    return timeBuf;
}

} // namespace

Logger::Logger(std::string logFile, std::string errorLogFile)
    : logFile(std::move(logFile)), errorLogFile(std::move(errorLogFile)) {
    for (const auto& path : {this->logFile, this->errorLogFile}) {
        if (path.empty()) {
            continue;
        }
        std::error_code ec;
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }
    }
}

void Logger::logMessage(const std::string& message) const {
    write(logFile, fmt::format("[{}] {}", logTimestamp(), message), false);
}

void Logger::logWarning(const std::string& message) const {
    write(errorLogFile, fmt::format("[{}] WARNING: {}", logTimestamp(), message), true);
}

void Logger::logError(const std::string& message) const {
    write(errorLogFile, fmt::format("[{}] ERROR: {}", logTimestamp(), message), true);
}

void Logger::write(const std::string& path, const std::string& entry, bool toStderr) const {
    std::lock_guard<std::mutex> lock(mutex);
    fmt::print(toStderr ? stderr : stdout, "{}\n", entry);

    if (path.empty()) {
        return;
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        fmt::print(stderr, "Error: Cannot write to log file: {}\n", path);
    }
}
