/**
 * @file notification.hpp
 * @brief Defines notification strategies for SiteVault.
 *
 * Run summaries can be pushed to an operator chat after each run. Delivery problems
 * are reported to the caller and never affect the outcome of the backup itself.
 *
 * @note Requires libcurl. Install libcurl4-openssl-dev or equivalent on Linux.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <expected>
#include <json/json.h>

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for sending notifications about backup status.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& message) = 0;
};

/**
 * @brief Telegram notification strategy.
 *
 * Sends notifications using the Telegram Bot API sendMessage call.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param config JSON configuration with bot_token and chat_id.
     * @throws std::runtime_error If bot_token or chat_id is missing.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    /**
     * @brief Sends a notification via Telegram.
     *
     * Fails on transport errors and on any HTTP status other than 200.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> notify(const std::string& message) override;

    /**
     * @brief Builds the sendMessage request URL with the message URL-encoded.
     */
    std::expected<std::string, std::string> requestUrl(const std::string& message) const;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId; ///< Telegram chat ID.
};

#endif // NOTIFICATION_HPP
