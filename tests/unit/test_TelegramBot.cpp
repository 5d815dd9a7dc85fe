#include <gtest/gtest.h>
#include "notify/TelegramBot.hpp"

#include <nlohmann/json.hpp>

using namespace sw::notify;
using json = nlohmann::json;

TEST(TelegramBotTest, SendMessagePayload) {
    const auto payload = TelegramBot::buildSendMessage(-1001234567890, "🟢 your node is back in sync");
    EXPECT_EQ(payload.at("chat_id").get<int64_t>(), -1001234567890);
    EXPECT_EQ(payload.at("text").get<std::string>(), "🟢 your node is back in sync");
    EXPECT_EQ(payload.size(), 2u);
}

TEST(TelegramBotTest, UnwrapsOkResponse) {
    const auto result = TelegramBot::unwrapResponse(200, R"({"ok":true,"result":{"id":1,"is_bot":true,"username":"watch_bot"}})");
    EXPECT_EQ(result.at("username"), "watch_bot");
}

TEST(TelegramBotTest, ErrorResponseCarriesDescription) {
    try {
        TelegramBot::unwrapResponse(400, R"({"ok":false,"error_code":400,"description":"Bad Request: chat not found"})");
        FAIL() << "expected NotifyError";
    } catch (const NotifyError& e) {
        EXPECT_STREQ(e.what(), "Telegram error 400: Bad Request: chat not found");
    }
}

TEST(TelegramBotTest, MalformedResponsesThrow) {
    EXPECT_THROW(TelegramBot::unwrapResponse(502, "Bad Gateway"), NotifyError);
    EXPECT_THROW(TelegramBot::unwrapResponse(200, "[]"), NotifyError);
    EXPECT_THROW(TelegramBot::unwrapResponse(200, R"({"ok":false})"), NotifyError);
}

TEST(TelegramBotTest, RedactsToken) {
    const std::string token = "123456:ABC";
    EXPECT_EQ(TelegramBot::redact("GET https://api.telegram.org/bot123456:ABC/getMe failed", token),
              "GET https://api.telegram.org/bot<redacted>/getMe failed");
    EXPECT_EQ(TelegramBot::redact("nothing here", token), "nothing here");
    EXPECT_EQ(TelegramBot::redact("rr", "r"), "<redacted><redacted>");
}

TEST(TelegramBotTest, EmptyTokenIsRejected) {
    sw::config::TelegramConfig cfg;
    EXPECT_THROW(TelegramBot{cfg}, NotifyError);
}

TEST(TelegramBotTest, UnreachableApiFailsConstruction) {
    sw::config::TelegramConfig cfg;
    cfg.bot_token = "123456:ABC";
    cfg.api_url = "http://127.0.0.1:1";
    cfg.get_timeout = std::chrono::seconds(2);
    try {
        TelegramBot bot(cfg);
        FAIL() << "expected NotifyError";
    } catch (const NotifyError& e) {
        EXPECT_EQ(std::string(e.what()).find("123456:ABC"), std::string::npos);
    }
}
