#include "kookbridge/core/config.hpp"
#include "kookbridge/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace kookbridge {

auto IdList::contains(std::string_view id) const -> bool {
    for (const auto& entry : entries) {
        if (entry == id) {
            return true;
        }
    }
    return false;
}

void to_json(json& j, const IdList& l) {
    j = l.entries;
}

void from_json(const json& j, IdList& l) {
    l.entries.clear();
    if (!j.is_array()) {
        throw std::invalid_argument("id list must be an array");
    }
    for (const auto& item : j) {
        if (item.is_string()) {
            l.entries.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            l.entries.push_back(std::to_string(item.get<int64_t>()));
        } else {
            throw std::invalid_argument("id list entries must be strings or integers");
        }
    }
}

namespace {

/// Expands `${VAR}` references in every string value of the document.
void expand_env_refs(json& node) {
    if (node.is_string()) {
        node = resolve_env_refs(node.get_ref<const std::string&>());
    } else if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            expand_env_refs(child);
        }
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        expand_env_refs(j);
        return j.get<Config>();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("KOOKBRIDGE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("KOOKBRIDGE_HISTORY_LIMIT")) {
        try {
            config.messages.group_chat.history_limit = std::stoi(val);
        } catch (const std::exception&) {
            LOG_WARN("Config: ignoring invalid KOOKBRIDGE_HISTORY_LIMIT '{}'", val);
        }
    }
    // The bot token itself is read from KOOK_BOT_TOKEN by the account
    // resolver so that its source can be reported.

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace kookbridge
