#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include <boost/asio/io_context.hpp>

#include "fakes.hpp"
#include "kookbridge/kook/monitor.hpp"

using namespace kookbridge;
using namespace kookbridge::kook;
using namespace std::chrono_literals;
namespace fakes = kookbridge::testing;

namespace {

struct EnvTokenGuard {
    EnvTokenGuard() { ::unsetenv("KOOK_BOT_TOKEN"); }
    ~EnvTokenGuard() { ::unsetenv("KOOK_BOT_TOKEN"); }
};

auto two_account_config() -> Config {
    Config config;
    KookConfig kook;
    kook.dm_policy = "open";
    kook.accounts = std::map<std::string, KookAccountConfig>{
        {"ops", KookAccountConfig{.token = "ops-token"}},
        {"sales", KookAccountConfig{.token = "sales-token"}},
    };
    config.channels.kook = kook;
    return config;
}

/// Monitor wired to fakes: one FakeApi and FakeConnector per account.
struct MonitorHarness {
    explicit MonitorHarness(Config cfg)
        : config(std::move(cfg)), host(std::make_shared<fakes::FakeHost>()) {}

    auto options() -> MonitorOptions {
        return MonitorOptions{
            .config = [this] { return config; },
            .host = host,
            .abort = &abort,
            .timings = GatewayTimings{
                .hello_timeout = 200ms,
                .heartbeat_interval = 50ms,
                .reconnect_base = 20ms,
                .reconnect_max = 100ms,
            },
            .make_api = [this](const AccountView& account) {
                auto api = std::make_shared<fakes::FakeApi>();
                apis[account.account_id] = api;
                return std::shared_ptr<KookApi>(api);
            },
            .make_connector = [this](boost::asio::any_io_executor executor) {
                auto connector = std::make_shared<fakes::FakeConnector>(executor);
                connector->on_connect = on_connect;
                connectors.push_back(connector);
                return std::shared_ptr<GatewayConnector>(connector);
            },
        };
    }

    void start(MonitorOptions opts) {
        boost::asio::co_spawn(ioc, monitor_kook(ioc, std::move(opts)),
            [this](std::exception_ptr, Result<void> r) { result = std::move(r); });
    }

    auto finished() const -> bool { return result.has_value(); }

    boost::asio::io_context ioc;
    AbortSignal abort;
    Config config;
    std::shared_ptr<fakes::FakeHost> host;
    std::map<std::string, std::shared_ptr<fakes::FakeApi>> apis;
    std::vector<std::shared_ptr<fakes::FakeConnector>> connectors;
    std::function<void(fakes::FakeConnection&, std::size_t)> on_connect;
    std::optional<Result<void>> result;
};

} // anonymous namespace

TEST_CASE("monitor_kook validates its inputs before connecting", "[kook][monitor]") {
    EnvTokenGuard guard;
    MonitorHarness h(two_account_config());

    SECTION("no config") {
        auto opts = h.options();
        opts.config = nullptr;
        auto result = fakes::run_sync(h.ioc, monitor_kook(h.ioc, std::move(opts)));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("no host") {
        auto opts = h.options();
        opts.host = nullptr;
        auto result = fakes::run_sync(h.ioc, monitor_kook(h.ioc, std::move(opts)));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("no abort signal") {
        auto opts = h.options();
        opts.abort = nullptr;
        auto result = fakes::run_sync(h.ioc, monitor_kook(h.ioc, std::move(opts)));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("disabled account") {
        h.config.channels.kook->accounts->at("ops").enabled = false;
        auto opts = h.options();
        opts.account_id = "ops";
        auto result = fakes::run_sync(h.ioc, monitor_kook(h.ioc, std::move(opts)));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
        CHECK(std::string(result.error().what()).find("\"ops\"") != std::string::npos);
    }

    SECTION("account without a token") {
        h.config.channels.kook->accounts->at("sales").token.reset();
        auto result = fakes::run_sync(h.ioc, monitor_kook(h.ioc, h.options()));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
    }

    CHECK(h.connectors.empty());
    CHECK(h.apis.empty());
}

TEST_CASE("monitor_kook with nothing enabled returns at once", "[kook][monitor]") {
    EnvTokenGuard guard;
    Config config;
    config.channels.kook = KookConfig{.enabled = false};
    MonitorHarness h(config);

    auto result = fakes::run_sync(h.ioc, monitor_kook(h.ioc, h.options()));
    CHECK(result.has_value());
    CHECK(h.connectors.empty());
}

TEST_CASE("monitor_kook runs every account until aborted", "[kook][monitor]") {
    EnvTokenGuard guard;
    MonitorHarness h(two_account_config());
    h.on_connect = [](fakes::FakeConnection& conn, std::size_t) {
        conn.hello();
        conn.event(1, fakes::direct_event("u-1", "hello"));
    };
    h.host->replies.push_back(kook::ReplyPayload{.text = "hi back"});

    h.start(h.options());
    REQUIRE(fakes::run_until(h.ioc, [&] { return h.host->contexts.size() == 2; }));

    REQUIRE(h.apis.size() == 2);
    CHECK(h.apis["ops"]->direct_messages.size() == 1);
    CHECK(h.apis["sales"]->direct_messages.size() == 1);
    CHECK(h.connectors.size() == 2);
    CHECK_FALSE(h.finished());

    h.abort.abort();
    REQUIRE(fakes::run_until(h.ioc, [&] { return h.finished(); }));
    CHECK(h.result->has_value());
    for (const auto& connector : h.connectors) {
        CHECK(connector->last().closed_by_client);
    }
}

TEST_CASE("monitor_kook filters the bot's own messages", "[kook][monitor]") {
    EnvTokenGuard guard;
    MonitorHarness h(two_account_config());
    h.on_connect = [](fakes::FakeConnection& conn, std::size_t) {
        conn.hello();
        conn.event(1, fakes::direct_event("bot-1", "echo of my own reply", "d-1"));
        conn.event(2, fakes::direct_event("u-1", "real message", "d-2"));
    };

    std::vector<std::optional<std::string>> identities;
    auto opts = h.options();
    opts.account_id = "ops";
    opts.hooks.on_identity = [&](const std::optional<std::string>& id) { identities.push_back(id); };

    h.start(std::move(opts));
    REQUIRE(fakes::run_until(h.ioc, [&] { return h.host->contexts.size() == 1; }));
    h.ioc.run_for(20ms);

    CHECK(h.host->contexts.size() == 1);
    CHECK(h.host->contexts[0].message_sid == "d-2");
    REQUIRE(identities.size() == 1);
    CHECK(identities[0].value() == "bot-1");

    h.abort.abort();
    REQUIRE(fakes::run_until(h.ioc, [&] { return h.finished(); }));
    CHECK(h.result->has_value());
}
