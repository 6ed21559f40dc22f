#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/core/error.hpp"
#include "kookbridge/kook/event.hpp"

namespace kookbridge::kook {

enum class AdmissionVerdict {
    Admit,
    SelfEcho,
    System,
    Unsupported,
};

auto admission_verdict_name(AdmissionVerdict verdict) -> std::string_view;

/// Rejection order: own message, system event, non-text type. The
/// self-echo check is skipped while the bot id is unknown.
auto classify_event(const InboundEvent& event, const std::optional<std::string>& bot_id)
    -> AdmissionVerdict;

/// Downstream handling of one admitted event.
class InboundEventHandler {
public:
    virtual ~InboundEventHandler() = default;

    virtual auto handle(InboundEvent event, std::optional<std::string> bot_id)
        -> boost::asio::awaitable<Result<void>> = 0;
};

struct AdmissionCounters {
    uint64_t admitted = 0;
    uint64_t self_echo = 0;
    uint64_t system = 0;
    uint64_t unsupported = 0;
    uint64_t malformed = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
};

/// Filters Event payloads and runs each admitted one as its own coroutine,
/// so a slow handler never holds up the session loop. Handler errors and
/// exceptions stop at this boundary.
///
/// Lives for the whole monitor run of one account, across reconnects.
class AdmissionPipeline : public std::enable_shared_from_this<AdmissionPipeline> {
public:
    AdmissionPipeline(boost::asio::any_io_executor executor,
                      std::shared_ptr<InboundEventHandler> handler,
                      std::string tag);

    /// Session-facing entry point. Returns immediately.
    void submit(nlohmann::json payload);

    void set_bot_id(std::optional<std::string> bot_id) { bot_id_ = std::move(bot_id); }
    [[nodiscard]] auto bot_id() const noexcept -> const std::optional<std::string>& { return bot_id_; }

    [[nodiscard]] auto counters() const noexcept -> const AdmissionCounters& { return counters_; }
    [[nodiscard]] auto in_flight() const noexcept -> uint64_t { return in_flight_; }

private:
    void count_rejection(AdmissionVerdict verdict);

    boost::asio::any_io_executor executor_;
    std::shared_ptr<InboundEventHandler> handler_;
    std::string tag_;
    std::optional<std::string> bot_id_;
    AdmissionCounters counters_;
    uint64_t in_flight_ = 0;
};

} // namespace kookbridge::kook
