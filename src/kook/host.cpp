#include "kookbridge/kook/host.hpp"

namespace kookbridge::kook {

void to_json(json& j, const InboundContext& ctx) {
    j = json{
        {"body", ctx.body},
        {"raw_body", ctx.raw_body},
        {"command_body", ctx.command_body},
        {"from", ctx.from},
        {"to", ctx.to},
        {"session_key", ctx.session_key},
        {"account_id", ctx.account_id},
        {"chat_type", ctx.chat_type},
        {"sender_name", ctx.sender_name},
        {"sender_id", ctx.sender_id},
        {"provider", ctx.provider},
        {"message_sid", ctx.message_sid},
        {"timestamp", ctx.timestamp_ms},
        {"was_mentioned", ctx.was_mentioned},
        {"command_authorized", ctx.command_authorized},
        {"originating_to", ctx.originating_to},
    };
    if (ctx.group_subject) {
        j["group_subject"] = *ctx.group_subject;
    }
}

auto reply_kind_name(ReplyKind kind) -> std::string_view {
    switch (kind) {
        case ReplyKind::Tool: return "tool";
        case ReplyKind::Block: return "block";
        case ReplyKind::Final: return "final";
        default: return "unknown";
    }
}

} // namespace kookbridge::kook
