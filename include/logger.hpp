/**
 * @file logger.hpp
 * @brief Operator log for SiteVault runs.
 *
 * Messages are echoed to the console and appended to an optional log file; warnings
 * and errors also go to a separate error log. Safe to use from concurrent workers.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <mutex>
#include <string>

/**
 * @brief Timestamped console and file logger.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path of the message log. Empty means console only.
     * @param errorLogFile Path of the warning/error log. Empty means console only.
     */
    explicit Logger(std::string logFile = {}, std::string errorLogFile = {});

    /**
     * @brief Logs an informational message to stdout and the log file.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning to stderr and the error log file.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the error log file.
     */
    void logError(const std::string& message) const;

private:
    void write(const std::string& path, const std::string& entry, bool toStderr) const;

    std::string logFile;      ///< Path to the message log.
    std::string errorLogFile; ///< Path to the warning/error log.
    mutable std::mutex mutex; ///< Serializes console and file output.
};

#endif // LOGGER_HPP
