#pragma once

#include <nlohmann/json.hpp>

namespace kookbridge {

using json = nlohmann::json;

enum class ChatType {
    Direct,
    Group,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ChatType, {
    {ChatType::Direct, "direct"},
    {ChatType::Group, "group"},
})

} // namespace kookbridge
