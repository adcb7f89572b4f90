/**
 * @file session_pool.hpp
 * @brief Cache of remote command channels bound to one authenticated connection.
 *
 * The pool is sized once by probing how many channels the remote endpoint accepts.
 * It is a cache, not a limiter: acquire() never blocks and falls back to opening a
 * fresh channel when the pool is empty. Callers that need bounded remote concurrency
 * must add their own limit around dispatch.
 *
 * Handles are use-once. A channel that has executed a command is consumed and is
 * closed on release; only channels that were never used go back to the pool, and only
 * while it holds fewer than its probed capacity.
 */

#ifndef SESSION_POOL_HPP
#define SESSION_POOL_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include "process.hpp"

/**
 * @brief One remote command execution channel.
 */
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    /**
     * @brief Executes one command on the channel, consuming it.
     *
     * @param command Shell command line.
     * @param onOutput Receives stdout chunks; returning false aborts the command.
     * @param errorOutput Receives stderr.
     * @param timeout Wall-clock limit; zero means none.
     * @return The remote exit status, or an error on transport failure or timeout.
     */
    virtual std::expected<int, std::string> execute(const std::string& command, const OutputSink& onOutput,
                                                     std::string& errorOutput, std::chrono::seconds timeout) = 0;

    /**
     * @brief Whether execute() has been called on this channel.
     */
    virtual bool consumed() const = 0;
};

/**
 * @brief Opens new channels on the underlying connection.
 */
class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;
    virtual std::expected<std::unique_ptr<CommandChannel>, std::string> openChannel() = 0;
};

/**
 * @brief Thread-safe cache of idle command channels.
 */
class SessionPool {
public:
    explicit SessionPool(ChannelFactory& factory);
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /**
     * @brief Discovers how many channels the endpoint tolerates and fills the pool.
     *
     * Opens channels one by one up to @p ceiling and stops at the first failure. The
     * channels that opened become the pool contents and their count its capacity.
     *
     * @return The probed capacity.
     */
    std::size_t probe(std::size_t ceiling);

    /**
     * @brief Checks out a channel: an idle pooled one, else a freshly opened one.
     */
    std::expected<std::unique_ptr<CommandChannel>, std::string> acquire();

    /**
     * @brief Returns a checked-out channel.
     *
     * Unused channels are pooled while there is spare capacity; everything else is closed.
     */
    void release(std::unique_ptr<CommandChannel> channel);

    /**
     * @brief Closes every pooled channel. Checked-out channels are unaffected.
     */
    void drain();

    std::size_t capacity() const;
    std::size_t available() const;

private:
    ChannelFactory& factory;
    mutable std::mutex mutex;
    std::deque<std::unique_ptr<CommandChannel>> idle;
    std::size_t capacity_ = 0;
};

#endif // SESSION_POOL_HPP
