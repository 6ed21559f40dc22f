#include "kookbridge/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kookbridge::utils {

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto timestamp_iso() -> std::string {
    return format_iso(timestamp_ms());
}

auto format_iso(int64_t epoch_ms) -> std::string {
    auto time = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_val{};
    gmtime_r(&time, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%FT%TZ");
    return oss.str();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), ::tolower);
    return result;
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

auto starts_with_icase(std::string_view s, std::string_view prefix) -> bool {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

auto url_encode(std::string_view s) -> std::string {
    std::ostringstream oss;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::hex << std::uppercase << std::setfill('0')
                << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return oss.str();
}

auto collapse_whitespace(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

auto truncate_utf8(std::string_view s, std::size_t max_chars) -> std::string {
    if (s.size() <= max_chars) return std::string(s);
    auto cut = max_chars;
    // Back off continuation bytes (10xxxxxx).
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(s.substr(0, cut));
}

namespace {

auto find_break(std::string_view window) -> size_t {
    if (auto pos = window.rfind("\n\n"); pos != std::string_view::npos && pos > 0) {
        return pos;
    }
    if (auto pos = window.rfind('\n'); pos != std::string_view::npos && pos > 0) {
        return pos;
    }
    if (auto pos = window.rfind(' '); pos != std::string_view::npos && pos > 0) {
        return pos;
    }
    return std::string_view::npos;
}

} // anonymous namespace

auto chunk_text(std::string_view text, std::size_t limit) -> std::vector<std::string> {
    std::vector<std::string> chunks;
    if (limit == 0) {
        auto whole = trim(text);
        if (!whole.empty()) chunks.push_back(std::move(whole));
        return chunks;
    }

    while (!text.empty()) {
        if (text.size() <= limit) {
            auto last = trim(text);
            if (!last.empty()) chunks.push_back(std::move(last));
            break;
        }

        auto cut = find_break(text.substr(0, limit));
        if (cut == std::string_view::npos) {
            cut = truncate_utf8(text, limit).size();
            if (cut == 0) cut = limit;
        }

        auto piece = trim(text.substr(0, cut));
        if (!piece.empty()) chunks.push_back(std::move(piece));
        text.remove_prefix(cut);
    }
    return chunks;
}

} // namespace kookbridge::utils
