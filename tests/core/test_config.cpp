#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "kookbridge/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = kookbridge::default_config();

    SECTION("log level defaults") {
        CHECK(cfg.log_level == "info");
    }

    SECTION("no KOOK section by default") {
        CHECK_FALSE(cfg.channels.kook.has_value());
    }

    SECTION("no global history limit") {
        CHECK_FALSE(cfg.messages.group_chat.history_limit.has_value());
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "kookbridge_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "channels": {
                "kook": {
                    "token": "top-token",
                    "dm_policy": "open",
                    "allow_from": ["1001", 1002],
                    "groups": {
                        "42": { "require_mention": false, "allow_from": [7] }
                    },
                    "accounts": {
                        "ops": { "token": "ops-token", "history_limit": 5 }
                    }
                }
            },
            "messages": { "group_chat": { "history_limit": 20 } }
        })";
    }

    auto cfg = kookbridge::load_config(tmp);

    CHECK(cfg.log_level == "debug");
    REQUIRE(cfg.channels.kook.has_value());
    const auto& kook = *cfg.channels.kook;
    CHECK(kook.token.value() == "top-token");
    CHECK(kook.dm_policy.value() == "open");
    REQUIRE(kook.allow_from.has_value());
    CHECK(kook.allow_from->entries == std::vector<std::string>{"1001", "1002"});
    REQUIRE(kook.groups.has_value());
    CHECK(kook.groups->at("42").require_mention.value() == false);
    CHECK(kook.groups->at("42").allow_from->contains("7"));
    REQUIRE(kook.accounts.has_value());
    CHECK(kook.accounts->at("ops").token.value() == "ops-token");
    CHECK(kook.accounts->at("ops").history_limit.value() == 5);
    CHECK(cfg.messages.group_chat.history_limit.value() == 20);

    fs::remove(tmp);
}

TEST_CASE("load_config expands env references", "[config]") {
    namespace fs = std::filesystem;
    ::setenv("TEST_KOOKBRIDGE_TOKEN", "secret-from-env", 1);

    auto tmp = fs::temp_directory_path() / "kookbridge_test_env_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "channels": { "kook": { "token": "${TEST_KOOKBRIDGE_TOKEN}" } } })";
    }

    auto cfg = kookbridge::load_config(tmp);
    REQUIRE(cfg.channels.kook.has_value());
    CHECK(cfg.channels.kook->token.value() == "secret-from-env");

    fs::remove(tmp);
    ::unsetenv("TEST_KOOKBRIDGE_TOKEN");
}

TEST_CASE("load_config returns defaults for missing or invalid files", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = kookbridge::load_config("/nonexistent/path/config.json");
        CHECK(cfg.log_level == "info");
        CHECK_FALSE(cfg.channels.kook.has_value());
    }

    SECTION("allow list with an unsupported entry") {
        auto tmp = fs::temp_directory_path() / "kookbridge_test_bad_config.json";
        {
            std::ofstream out(tmp);
            out << R"({ "log_level": "warn", "channels": { "kook": { "allow_from": [true] } } })";
        }
        auto cfg = kookbridge::load_config(tmp);
        CHECK(cfg.log_level == "info");
        CHECK_FALSE(cfg.channels.kook.has_value());
        fs::remove(tmp);
    }

    SECTION("malformed JSON") {
        auto tmp = fs::temp_directory_path() / "kookbridge_test_broken_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = kookbridge::load_config(tmp);
        CHECK(cfg.log_level == "info");
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    ::setenv("KOOKBRIDGE_LOG_LEVEL", "trace", 1);
    ::setenv("KOOKBRIDGE_HISTORY_LIMIT", "12", 1);

    auto cfg = kookbridge::load_config_from_env();

    CHECK(cfg.log_level == "trace");
    CHECK(cfg.messages.group_chat.history_limit.value() == 12);

    ::setenv("KOOKBRIDGE_HISTORY_LIMIT", "lots", 1);
    auto lenient = kookbridge::load_config_from_env();
    CHECK_FALSE(lenient.messages.group_chat.history_limit.has_value());

    ::unsetenv("KOOKBRIDGE_LOG_LEVEL");
    ::unsetenv("KOOKBRIDGE_HISTORY_LIMIT");
}

TEST_CASE("IdList accepts string and numeric ids", "[config]") {
    auto list = kookbridge::json::parse(R"(["abc", 123456789012])").get<kookbridge::IdList>();

    CHECK(list.contains("abc"));
    CHECK(list.contains("123456789012"));
    CHECK_FALSE(list.contains("123"));

    kookbridge::json back = list;
    CHECK(back == kookbridge::json::parse(R"(["abc", "123456789012"])"));
}
