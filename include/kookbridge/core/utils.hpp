#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kookbridge::utils {

auto timestamp_ms() -> int64_t;
auto timestamp_iso() -> std::string;
auto format_iso(int64_t epoch_ms) -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto starts_with(std::string_view s, std::string_view prefix) -> bool;
auto starts_with_icase(std::string_view s, std::string_view prefix) -> bool;
auto url_encode(std::string_view s) -> std::string;

/// Collapses every run of whitespace into a single space and trims the ends.
auto collapse_whitespace(std::string_view s) -> std::string;

/// Returns at most `max_chars` bytes of `s`, never cutting a UTF-8 sequence.
auto truncate_utf8(std::string_view s, std::size_t max_chars) -> std::string;

/// Splits `text` into pieces no longer than `limit` bytes, preferring
/// paragraph breaks, then line breaks, then spaces. Pieces are trimmed and
/// empty pieces dropped.
auto chunk_text(std::string_view text, std::size_t limit) -> std::vector<std::string>;

} // namespace kookbridge::utils
