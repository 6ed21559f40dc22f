#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "kookbridge/kook/account.hpp"

using namespace kookbridge;
using namespace kookbridge::kook;

namespace {

auto make_config(const char* text) -> Config {
    return json::parse(text).get<Config>();
}

/// Clears KOOK_BOT_TOKEN for the scope of a test.
struct EnvTokenGuard {
    EnvTokenGuard() { ::unsetenv("KOOK_BOT_TOKEN"); }
    ~EnvTokenGuard() { ::unsetenv("KOOK_BOT_TOKEN"); }
};

} // anonymous namespace

TEST_CASE("normalize_account_id", "[kook][account]") {
    CHECK(normalize_account_id("  Ops ") == "ops");
    CHECK(normalize_account_id("") == "default");
    CHECK(normalize_account_id("   ") == "default");
}

TEST_CASE("resolve_account applies defaults", "[kook][account]") {
    EnvTokenGuard guard;
    auto view = resolve_account(Config{});

    CHECK(view.account_id == "default");
    CHECK(view.enabled);
    CHECK_FALSE(view.configured);
    CHECK(view.token_source == TokenSource::None);
    CHECK(view.dm_policy == "pairing");
    CHECK(view.group_policy == "allowlist");
    CHECK(view.require_mention);
    CHECK(view.text_chunk_limit == 4000);
    CHECK(view.history_limit == 50);
    CHECK(view.tag() == "kook[default]");
}

TEST_CASE("resolve_account layers account over top-level settings", "[kook][account]") {
    EnvTokenGuard guard;
    auto config = make_config(R"({
        "channels": { "kook": {
            "token": "top-token",
            "dm_policy": "open",
            "group_policy": "open",
            "require_mention": false,
            "history_limit": 10,
            "groups": { "a": { "require_mention": true }, "b": { "enabled": false } },
            "accounts": {
                "default": {},
                "Ops": {
                    "token": " ops-token ",
                    "dm_policy": "allowlist",
                    "allow_from": ["u1"],
                    "groups": { "b": { "enabled": true } }
                }
            }
        } }
    })");

    SECTION("default account inherits the top-level token") {
        auto view = resolve_account(config, "default");
        CHECK(view.token == "top-token");
        CHECK(view.token_source == TokenSource::Config);
        CHECK(view.dm_policy == "open");
        CHECK_FALSE(view.require_mention);
        CHECK(view.history_limit == 10);
    }

    SECTION("named account overrides and merges groups") {
        auto view = resolve_account(config, "ops");
        CHECK(view.account_id == "ops");
        CHECK(view.token == "ops-token");
        CHECK(view.dm_policy == "allowlist");
        CHECK(view.allow_from.contains("u1"));
        CHECK(view.group_policy == "open");
        REQUIRE(view.groups.size() == 2);
        CHECK(view.groups.at("a").require_mention.value());
        CHECK(view.groups.at("b").enabled.value());
    }

    SECTION("non-default accounts never borrow the top-level token") {
        auto cfg = config;
        cfg.channels.kook->accounts->at("Ops").token.reset();
        auto view = resolve_account(cfg, "ops");
        CHECK_FALSE(view.configured);
    }
}

TEST_CASE("resolve_account token and enablement rules", "[kook][account]") {
    EnvTokenGuard guard;

    SECTION("environment token is the last resort") {
        ::setenv("KOOK_BOT_TOKEN", "env-token", 1);
        auto view = resolve_account(Config{});
        CHECK(view.configured);
        CHECK(view.token == "env-token");
        CHECK(view.token_source == TokenSource::Env);
    }

    SECTION("top-level enabled=false disables every account") {
        auto config = make_config(R"({"channels":{"kook":{"enabled":false,"token":"t"}}})");
        auto view = resolve_account(config);
        CHECK_FALSE(view.enabled);
        CHECK(view.configured);
    }

    SECTION("account enabled=false") {
        auto config = make_config(R"({"channels":{"kook":{"accounts":{"x":{"enabled":false}}}}})");
        CHECK_FALSE(resolve_account(config, "x").enabled);
    }
}

TEST_CASE("history limit resolution order", "[kook][account]") {
    EnvTokenGuard guard;

    SECTION("global group chat limit") {
        auto config = make_config(R"({"messages":{"group_chat":{"history_limit":7}}})");
        CHECK(resolve_account(config).history_limit == 7);
    }

    SECTION("account beats global") {
        auto config = make_config(R"({
            "channels":{"kook":{"accounts":{"default":{"history_limit":3}}}},
            "messages":{"group_chat":{"history_limit":7}}
        })");
        CHECK(resolve_account(config).history_limit == 3);
    }

    SECTION("negative limits clamp to zero") {
        auto config = make_config(R"({"channels":{"kook":{"history_limit":-4}}})");
        CHECK(resolve_account(config).history_limit == 0);
    }
}

TEST_CASE("account listing", "[kook][account]") {
    EnvTokenGuard guard;

    SECTION("no accounts section lists default") {
        CHECK(list_account_ids(Config{}) == std::vector<std::string>{"default"});
        CHECK(default_account_id(Config{}) == "default");
    }

    SECTION("default preferred when listed") {
        auto config = make_config(R"({"channels":{"kook":{"accounts":{"alpha":{},"default":{}}}}})");
        CHECK(default_account_id(config) == "default");
    }

    SECTION("first listed id otherwise") {
        auto config = make_config(R"({"channels":{"kook":{"accounts":{"beta":{},"alpha":{}}}}})");
        CHECK(default_account_id(config) == "alpha");
    }

    SECTION("enabled accounts and status issues") {
        auto config = make_config(R"({"channels":{"kook":{"accounts":{
            "a":{"token":"t"}, "b":{"enabled":false,"token":"t"}, "c":{}
        }}}})");
        auto enabled = list_enabled_accounts(config);
        REQUIRE(enabled.size() == 2);
        CHECK(enabled[0].account_id == "a");
        CHECK(enabled[1].account_id == "c");

        auto issues = collect_status_issues(enabled);
        REQUIRE(issues.size() == 1);
        CHECK(issues[0].find("'c'") != std::string::npos);
    }
}

TEST_CASE("collect_warnings flags open group policy", "[kook][account]") {
    AccountView view;
    CHECK(collect_warnings(view).empty());
    view.group_policy = "open";
    REQUIRE(collect_warnings(view).size() == 1);
}
