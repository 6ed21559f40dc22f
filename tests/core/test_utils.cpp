#include <catch2/catch_test_macros.hpp>

#include <string>

#include "kookbridge/core/utils.hpp"

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(kookbridge::utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(kookbridge::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("empty string") {
        REQUIRE(kookbridge::utils::trim("") == "");
    }

    SECTION("only whitespace") {
        REQUIRE(kookbridge::utils::trim("   \t\n  ") == "");
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(kookbridge::utils::trim("  hello world  ") == "hello world");
    }
}

TEST_CASE("split divides string by delimiter", "[utils]") {
    SECTION("basic split on comma") {
        auto parts = kookbridge::utils::split("a,b,c", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "a");
        CHECK(parts[1] == "b");
        CHECK(parts[2] == "c");
    }

    SECTION("empty fields are kept") {
        auto parts = kookbridge::utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[1].empty());
    }

    SECTION("no delimiter present") {
        auto parts = kookbridge::utils::split("hello", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "hello");
    }
}

TEST_CASE("case helpers", "[utils]") {
    CHECK(kookbridge::utils::to_lower("KOOK:User:42") == "kook:user:42");
    CHECK(kookbridge::utils::starts_with("channel:1", "channel:"));
    CHECK_FALSE(kookbridge::utils::starts_with("chan", "channel:"));
    CHECK(kookbridge::utils::starts_with_icase("KOOK:channel:1", "kook:"));
    CHECK_FALSE(kookbridge::utils::starts_with_icase("ko", "kook:"));
}

TEST_CASE("url_encode escapes reserved characters", "[utils]") {
    CHECK(kookbridge::utils::url_encode("abc-_.~") == "abc-_.~");
    CHECK(kookbridge::utils::url_encode("a b/c") == "a%20b%2Fc");
    CHECK(kookbridge::utils::url_encode("x=1&y") == "x%3D1%26y");
}

TEST_CASE("collapse_whitespace", "[utils]") {
    CHECK(kookbridge::utils::collapse_whitespace("  hello \n\t world  ") == "hello world");
    CHECK(kookbridge::utils::collapse_whitespace("") == "");
    CHECK(kookbridge::utils::collapse_whitespace(" \n ") == "");
}

TEST_CASE("truncate_utf8 never splits a code point", "[utils]") {
    SECTION("short input unchanged") {
        CHECK(kookbridge::utils::truncate_utf8("hello", 10) == "hello");
    }

    SECTION("ASCII cut") {
        CHECK(kookbridge::utils::truncate_utf8("hello world", 5) == "hello");
    }

    SECTION("multi-byte cut backs off") {
        // "你好" is two 3-byte sequences.
        std::string text = "\xE4\xBD\xA0\xE5\xA5\xBD";
        CHECK(kookbridge::utils::truncate_utf8(text, 4) == "\xE4\xBD\xA0");
        CHECK(kookbridge::utils::truncate_utf8(text, 3) == "\xE4\xBD\xA0");
        CHECK(kookbridge::utils::truncate_utf8(text, 2).empty());
    }
}

TEST_CASE("chunk_text splits on natural boundaries", "[utils]") {
    SECTION("short text is one chunk") {
        auto chunks = kookbridge::utils::chunk_text("hello", 4000);
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0] == "hello");
    }

    SECTION("paragraph break preferred") {
        auto chunks = kookbridge::utils::chunk_text("para one\n\npara two", 12);
        REQUIRE(chunks.size() == 2);
        CHECK(chunks[0] == "para one");
        CHECK(chunks[1] == "para two");
    }

    SECTION("word break") {
        auto chunks = kookbridge::utils::chunk_text("aaaa bbbb cccc", 9);
        REQUIRE(chunks.size() == 3);
        CHECK(chunks[0] == "aaaa");
        CHECK(chunks[1] == "bbbb");
        CHECK(chunks[2] == "cccc");
    }

    SECTION("hard cut without whitespace") {
        auto chunks = kookbridge::utils::chunk_text("abcdefghij", 4);
        REQUIRE(chunks.size() == 3);
        CHECK(chunks[0] == "abcd");
        CHECK(chunks[2] == "ij");
    }

    SECTION("whitespace-only text yields nothing") {
        CHECK(kookbridge::utils::chunk_text("   \n  ", 10).empty());
    }

    SECTION("every chunk respects the limit") {
        std::string text;
        for (int i = 0; i < 200; ++i) {
            text += "word" + std::to_string(i) + (i % 17 == 0 ? "\n" : " ");
        }
        for (const auto& chunk : kookbridge::utils::chunk_text(text, 50)) {
            CHECK(chunk.size() <= 50);
            CHECK_FALSE(chunk.empty());
        }
    }
}

TEST_CASE("timestamps", "[utils]") {
    CHECK(kookbridge::utils::timestamp_ms() > 0);
    CHECK(kookbridge::utils::format_iso(0) == "1970-01-01T00:00:00Z");
    CHECK(kookbridge::utils::format_iso(1700000000123) == "2023-11-14T22:13:20Z");
}
