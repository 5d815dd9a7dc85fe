#pragma once

#include "notify/Notifier.hpp"
#include "config/Config.hpp"
#include "util/duration.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sw::notify {

// Telegram Bot API client. The constructor validates the token with getMe and throws NotifyError on failure.
class TelegramBot final : public Notifier {
public:
    explicit TelegramBot(const config::TelegramConfig& cfg);

    void send(int64_t chatId, const std::string& text) override;

    [[nodiscard]] const std::string& username() const { return username_; }

    static nlohmann::json buildSendMessage(int64_t chatId, const std::string& text);

    // Returns the "result" member of a Bot API response, or throws NotifyError with Telegram's description.
    static nlohmann::json unwrapResponse(long httpStatus, const std::string& body);

    // Replaces every occurrence of token in text so it never reaches logs or error messages.
    static std::string redact(std::string text, const std::string& token);

private:
    [[nodiscard]] std::string methodUrl(const std::string& method) const;

    std::string token_;
    std::string apiUrl_;
    util::Duration getTimeout_;
    util::Duration postTimeout_;
    std::string username_;
};

}
