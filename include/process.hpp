/**
 * @file process.hpp
 * @brief Child process execution with separate stdout streaming and stderr capture.
 */

#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Receives a chunk of child output. Returning false aborts the child.
 */
using OutputSink = std::function<bool(const char* data, std::size_t size)>;

/**
 * @brief Launch options for runProcess.
 */
struct ProcessOptions {
    std::vector<std::pair<std::string, std::string>> environment; ///< Added to (or overriding) the inherited environment.
    std::chrono::seconds timeout{0};                               ///< Wall-clock limit; zero means none.
};

/**
 * @brief Outcome of a child process that was started.
 */
struct ProcessResult {
    int exitCode = -1;         ///< Exit status, or 128 + signal number when killed.
    std::string errorOutput;   ///< Everything the child wrote to stderr.
    bool timedOut = false;     ///< The child was killed because the timeout elapsed.
    bool outputRejected = false; ///< The sink returned false and the child was killed.

    bool succeeded() const { return exitCode == 0 && !timedOut && !outputRejected; }
};

/**
 * @brief Runs a program by argument vector, without a shell.
 *
 * stdin is /dev/null, stdout is delivered to @p onOutput as it arrives and stderr is
 * collected into the result.
 *
 * @param argv Program and arguments; argv[0] is looked up on PATH.
 * @param onOutput Sink for stdout. May be empty to discard output.
 * @param options Extra environment and timeout.
 * @return The process result, or an error if the process could not be started.
 */
std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string>& argv,
                                                     const OutputSink& onOutput,
                                                     const ProcessOptions& options = {});

/**
 * @brief Describes a failed ProcessResult, including stderr verbatim.
 */
std::string describeFailure(const std::string& program, const ProcessResult& result);

#endif // PROCESS_HPP
