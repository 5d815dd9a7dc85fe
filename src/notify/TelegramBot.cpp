#include "notify/TelegramBot.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <string_view>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sw::notify;
using namespace sw::util;
using json = nlohmann::json;

TelegramBot::TelegramBot(const config::TelegramConfig& cfg)
    : token_(cfg.bot_token), apiUrl_(cfg.api_url),
      getTimeout_(cfg.get_timeout), postTimeout_(cfg.post_timeout) {
    if (token_.empty()) throw NotifyError("bot token is empty");
    while (!apiUrl_.empty() && apiUrl_.back() == '/') apiUrl_.pop_back();
    if (apiUrl_.empty()) throw NotifyError("Telegram API URL is empty");
    ensureCurlGlobalInit();

    const auto resp = httpGet(methodUrl("getMe"), getTimeout_);
    if (!resp.transportOk())
        throw NotifyError(redact(fmt::format("getMe failed: {}", resp.describe()), token_));

    const auto me = unwrapResponse(resp.http, resp.body);
    username_ = me.is_object() ? me.value("username", std::string()) : std::string();

    log::Registry::notify()->info("[TelegramBot] Authorized as @{}", username_);
}

void TelegramBot::send(const int64_t chatId, const std::string& text) {
    const auto payload = buildSendMessage(chatId, text).dump();

    const auto resp = httpPostJson(methodUrl("sendMessage"), payload, postTimeout_);
    if (!resp.transportOk())
        throw NotifyError(redact(fmt::format("sendMessage failed: {}", resp.describe()), token_));

    unwrapResponse(resp.http, resp.body);
    log::Registry::notify()->debug("[TelegramBot] Delivered message to chat {}", chatId);
}

std::string TelegramBot::methodUrl(const std::string& method) const {
    return fmt::format("{}/bot{}/{}", apiUrl_, token_, method);
}

json TelegramBot::buildSendMessage(const int64_t chatId, const std::string& text) {
    return {
        {"chat_id", chatId},
        {"text", text}
    };
}

json TelegramBot::unwrapResponse(const long httpStatus, const std::string& body) {
    const auto doc = json::parse(body, nullptr, false);

    if (doc.is_discarded() || !doc.is_object()) {
        if (httpStatus / 100 != 2) throw NotifyError(fmt::format("Telegram returned HTTP {}", httpStatus));
        throw NotifyError("malformed Telegram response");
    }

    if (!doc.value("ok", false) || httpStatus / 100 != 2) {
        const auto code = doc.value("error_code", static_cast<int>(httpStatus));
        const auto description = doc.value("description", std::string("unknown error"));
        throw NotifyError(fmt::format("Telegram error {}: {}", code, description));
    }

    return doc.contains("result") ? doc.at("result") : json();
}

std::string TelegramBot::redact(std::string text, const std::string& token) {
    if (token.empty()) return text;
    static constexpr std::string_view mask = "<redacted>";
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + mask.size()))
        text.replace(pos, token.size(), mask);
    return text;
}
