#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>

#include "../kook/fakes.hpp"
#include "kookbridge/channels/kook.hpp"

using namespace kookbridge;
using namespace kookbridge::channels;
using namespace std::chrono_literals;
namespace fakes = kookbridge::testing;

namespace {

auto channel_config() -> Config {
    Config config;
    KookConfig kook;
    kook.token = "token";
    kook.dm_policy = "open";
    kook.accounts = std::map<std::string, KookAccountConfig>{
        {"default", KookAccountConfig{}},
        {"ops", KookAccountConfig{.token = "ops-token"}},
        {"idle", KookAccountConfig{}},
    };
    config.channels.kook = kook;
    return config;
}

struct ChannelHarness {
    ChannelHarness()
        : config(channel_config())
        , host(std::make_shared<fakes::FakeHost>())
        , api(std::make_shared<fakes::FakeApi>())
    {}

    auto options(std::string account_id = "") -> KookChannelOptions {
        return KookChannelOptions{
            .config = [this] { return config; },
            .host = host,
            .account_id = std::move(account_id),
            .timings = kook::GatewayTimings{
                .hello_timeout = 200ms,
                .heartbeat_interval = 50ms,
                .reconnect_base = 20ms,
                .reconnect_max = 100ms,
            },
            .make_api = [this](const kook::AccountView& account) {
                api_accounts.push_back(account.account_id);
                return std::shared_ptr<kook::KookApi>(api);
            },
            .make_connector = [this](boost::asio::any_io_executor executor) {
                connector = std::make_shared<fakes::FakeConnector>(executor);
                connector->on_connect = [](fakes::FakeConnection& conn, std::size_t) {
                    conn.hello();
                };
                return std::shared_ptr<kook::GatewayConnector>(connector);
            },
        };
    }

    boost::asio::io_context ioc;
    Config config;
    std::shared_ptr<fakes::FakeHost> host;
    std::shared_ptr<fakes::FakeApi> api;
    std::shared_ptr<fakes::FakeConnector> connector;
    std::vector<std::string> api_accounts;
};

} // anonymous namespace

TEST_CASE("KookChannel identity", "[channels][kook]") {
    ChannelHarness h;
    KookChannel channel(h.options(" Ops "), h.ioc);

    CHECK(channel.name() == "ops");
    CHECK(channel.type() == "kook");
    CHECK_FALSE(channel.is_running());

    auto status = channel.status();
    CHECK(status.account_id == "ops");
    CHECK(status.state == kook::SessionState::Disconnected);

    json j = status;
    CHECK(j["state"] == "disconnected");
    CHECK(j["running"] == false);
    CHECK_FALSE(j.contains("bot_id"));
}

TEST_CASE("KookChannel start and stop", "[channels][kook]") {
    ChannelHarness h;
    KookChannel channel(h.options(), h.ioc);

    std::optional<Result<void>> result;
    boost::asio::co_spawn(h.ioc, channel.start(),
        [&](std::exception_ptr, Result<void> r) { result = std::move(r); });

    REQUIRE(fakes::run_until(h.ioc, [&] {
        return channel.status().state == kook::SessionState::Live;
    }));
    CHECK(channel.is_running());
    auto status = channel.status();
    CHECK(status.running);
    CHECK(status.bot_id.value() == "bot-1");
    CHECK(status.reconnect_attempt == 0);

    SECTION("a second start is refused") {
        std::optional<Result<void>> second;
        boost::asio::co_spawn(h.ioc, channel.start(),
            [&](std::exception_ptr, Result<void> r) { second = std::move(r); });
        REQUIRE(fakes::run_until(h.ioc, [&] { return second.has_value(); }));
        REQUIRE_FALSE(second->has_value());
        CHECK(second->error().code() == ErrorCode::ChannelError);
    }

    boost::asio::co_spawn(h.ioc, channel.stop(), boost::asio::detached);
    REQUIRE(fakes::run_until(h.ioc, [&] { return result.has_value(); }));
    CHECK(result->has_value());
    CHECK_FALSE(channel.is_running());
    CHECK_FALSE(channel.status().running);
    CHECK(channel.status().state == kook::SessionState::Disconnected);
}

TEST_CASE("KookChannel start reports configuration errors", "[channels][kook]") {
    ChannelHarness h;
    h.config.channels.kook->accounts->at("ops").enabled = false;
    KookChannel channel(h.options("ops"), h.ioc);

    auto result = fakes::run_sync(h.ioc, channel.start());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InvalidConfig);
    CHECK_FALSE(channel.is_running());
    CHECK(channel.status().last_error.has_value());
    CHECK(h.connector == nullptr);
}

TEST_CASE("KookChannel send", "[channels][kook]") {
    ChannelHarness h;
    KookChannel channel(h.options(), h.ioc);

    SECTION("text to a channel") {
        OutgoingMessage msg{.channel = "kook", .recipient_id = "channel:c-1", .text = "hello"};
        auto result = fakes::run_sync(h.ioc, channel.send(msg));
        REQUIRE(result.has_value());
        REQUIRE(h.api->channel_messages.size() == 1);
        CHECK(h.api->channel_messages[0].target_id == "c-1");
        CHECK(h.api_accounts == std::vector<std::string>{"default"});
    }

    SECTION("media to a user through another account") {
        OutgoingMessage msg{
            .channel = "kook",
            .account_id = "ops",
            .recipient_id = "user:u-1",
            .text = "look",
            .media_url = "https://img.test/a.png",
            .reply_to = "m-5",
        };
        auto result = fakes::run_sync(h.ioc, channel.send(msg));
        REQUIRE(result.has_value());
        REQUIRE(h.api->direct_messages.size() == 2);
        CHECK(h.api->direct_messages[1].content == "https://img.test/a.png");
        CHECK(h.api_accounts == std::vector<std::string>{"ops"});
    }

    SECTION("account without a token") {
        ::unsetenv("KOOK_BOT_TOKEN");
        OutgoingMessage msg{.channel = "kook", .account_id = "idle",
                            .recipient_id = "channel:c-1", .text = "x"};
        auto result = fakes::run_sync(h.ioc, channel.send(msg));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
        CHECK(h.api_accounts.empty());
    }

    SECTION("API failure") {
        h.api->fail_sends = true;
        OutgoingMessage msg{.channel = "kook", .recipient_id = "channel:c-1", .text = "x"};
        auto result = fakes::run_sync(h.ioc, channel.send(msg));
        CHECK_FALSE(result.has_value());
    }
}
