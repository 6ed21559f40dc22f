#include "kookbridge/kook/admission.hpp"
#include "kookbridge/core/logger.hpp"

#include <exception>

#include <boost/asio/co_spawn.hpp>

namespace kookbridge::kook {

auto admission_verdict_name(AdmissionVerdict verdict) -> std::string_view {
    switch (verdict) {
        case AdmissionVerdict::Admit: return "admit";
        case AdmissionVerdict::SelfEcho: return "self_echo";
        case AdmissionVerdict::System: return "system";
        case AdmissionVerdict::Unsupported: return "unsupported";
        default: return "unknown";
    }
}

auto classify_event(const InboundEvent& event, const std::optional<std::string>& bot_id)
    -> AdmissionVerdict {
    if (bot_id && !bot_id->empty() && event.author_id == *bot_id) {
        return AdmissionVerdict::SelfEcho;
    }
    if (event.message_type == message_type::System) {
        return AdmissionVerdict::System;
    }
    if (event.message_type != message_type::Text &&
        event.message_type != message_type::KMarkdown &&
        event.message_type != message_type::Card) {
        return AdmissionVerdict::Unsupported;
    }
    return AdmissionVerdict::Admit;
}

AdmissionPipeline::AdmissionPipeline(boost::asio::any_io_executor executor,
                                     std::shared_ptr<InboundEventHandler> handler,
                                     std::string tag)
    : executor_(std::move(executor))
    , handler_(std::move(handler))
    , tag_(std::move(tag))
{
}

void AdmissionPipeline::submit(nlohmann::json payload) {
    Result<InboundEvent> event = [&]() -> Result<InboundEvent> {
        try {
            return parse_inbound_event(payload);
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(
                make_error(ErrorCode::SerializationError, "Malformed event payload", e.what()));
        }
    }();
    if (!event) {
        ++counters_.malformed;
        LOG_WARN("{}: dropping undecodable event: {}", tag_, event.error().what());
        return;
    }

    auto verdict = classify_event(*event, bot_id_);
    if (verdict != AdmissionVerdict::Admit) {
        count_rejection(verdict);
        LOG_TRACE("{}: dropped event {} ({})", tag_, event->message_id,
                  admission_verdict_name(verdict));
        return;
    }

    ++counters_.admitted;
    ++in_flight_;

    auto self = shared_from_this();
    auto message_id = event->message_id;
    boost::asio::co_spawn(
        executor_,
        [handler = handler_, ev = std::move(*event), bot_id = bot_id_]() mutable
            -> boost::asio::awaitable<Result<void>> {
            co_return co_await handler->handle(std::move(ev), std::move(bot_id));
        },
        [self, message_id](std::exception_ptr ep, Result<void> result) {
            --self->in_flight_;
            if (ep) {
                ++self->counters_.failed;
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("{}: error handling message {}: {}", self->tag_, message_id, e.what());
                } catch (...) {
                    LOG_ERROR("{}: error handling message {}: unknown exception",
                              self->tag_, message_id);
                }
                return;
            }
            if (!result) {
                ++self->counters_.failed;
                LOG_ERROR("{}: failed to dispatch message {}: {}",
                          self->tag_, message_id, result.error().what());
                return;
            }
            ++self->counters_.completed;
        });
}

void AdmissionPipeline::count_rejection(AdmissionVerdict verdict) {
    switch (verdict) {
        case AdmissionVerdict::SelfEcho: ++counters_.self_echo; break;
        case AdmissionVerdict::System: ++counters_.system; break;
        case AdmissionVerdict::Unsupported: ++counters_.unsupported; break;
        case AdmissionVerdict::Admit: break;
    }
}

} // namespace kookbridge::kook
