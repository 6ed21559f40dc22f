#include <catch2/catch_test_macros.hpp>

#include "kookbridge/channels/message.hpp"

using namespace kookbridge::channels;
using json = nlohmann::json;

TEST_CASE("OutgoingMessage serialization", "[channels][message]") {
    SECTION("optional fields are omitted when unset") {
        OutgoingMessage msg;
        msg.channel = "kook";
        msg.recipient_id = "channel:123";
        msg.text = "hello";

        json j = msg;
        CHECK(j["channel"] == "kook");
        CHECK(j["recipient_id"] == "channel:123");
        CHECK(j["text"] == "hello");
        CHECK_FALSE(j.contains("account_id"));
        CHECK_FALSE(j.contains("media_url"));
        CHECK_FALSE(j.contains("reply_to"));
    }

    SECTION("from_json reads every field") {
        json j = {
            {"channel", "kook"},
            {"account_id", "ops"},
            {"recipient_id", "user:42"},
            {"text", "hi"},
            {"media_url", "https://img.test/a.png"},
            {"reply_to", "m-1"},
        };

        auto msg = j.get<OutgoingMessage>();
        CHECK(msg.account_id.value() == "ops");
        CHECK(msg.recipient_id == "user:42");
        CHECK(msg.media_url.value() == "https://img.test/a.png");
        CHECK(msg.reply_to.value() == "m-1");
    }

    SECTION("text may be absent") {
        json j = {{"channel", "kook"}, {"recipient_id", "channel:1"}};
        auto msg = j.get<OutgoingMessage>();
        CHECK(msg.text.empty());
        CHECK_FALSE(msg.account_id.has_value());
    }

    SECTION("recipient is required") {
        json j = {{"channel", "kook"}};
        CHECK_THROWS_AS(j.get<OutgoingMessage>(), json::out_of_range);
    }
}
