#include "notification.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <stdexcept>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config["bot_token"].asString()), chatId(config["chat_id"].asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("Telegram notification requires bot_token and chat_id");
    }
}

std::expected<std::string, std::string> TelegramNotificationStrategy::requestUrl(const std::string& message) const {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }
    char* escaped = curl_easy_escape(curl.get(), message.c_str(), static_cast<int>(message.length()));
    if (!escaped) {
        return std::unexpected("Failed to URL-encode Telegram message");
    }
    std::string escapedMessage = escaped;
    curl_free(escaped);
    return fmt::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}", botToken, chatId, escapedMessage);
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& message) {
    auto url = requestUrl(message);
    if (!url) {
        return std::unexpected(url.error());
    }

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(fmt::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        return std::unexpected(fmt::format("Failed to send Telegram notification: HTTP status {}", status));
    }
    return {};
}
