#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include <boost/asio/io_context.hpp>

#include "fakes.hpp"
#include "kookbridge/kook/admission.hpp"

using namespace kookbridge;
using namespace kookbridge::kook;
namespace fakes = kookbridge::testing;

namespace {

class RecordingHandler : public InboundEventHandler {
public:
    auto handle(InboundEvent event, std::optional<std::string> bot_id)
        -> boost::asio::awaitable<Result<void>> override {
        seen.push_back(event.message_id);
        seen_bot_ids.push_back(bot_id);
        if (event.content == "fail") {
            co_return make_fail(make_error(ErrorCode::ApiError, "downstream failed"));
        }
        if (event.content == "throw") {
            throw std::runtime_error("handler threw");
        }
        co_return ok_result();
    }

    std::vector<std::string> seen;
    std::vector<std::optional<std::string>> seen_bot_ids;
};

auto parsed(const json& payload) -> InboundEvent {
    return *parse_inbound_event(payload);
}

} // anonymous namespace

TEST_CASE("classify_event rejection order", "[kook][admission]") {
    auto event = parsed(fakes::group_event("chan-1", "bot-1", "hello"));

    SECTION("own message is self echo") {
        CHECK(classify_event(event, std::string("bot-1")) == AdmissionVerdict::SelfEcho);
    }

    SECTION("self echo checked before system type") {
        event.message_type = message_type::System;
        CHECK(classify_event(event, std::string("bot-1")) == AdmissionVerdict::SelfEcho);
    }

    SECTION("unknown bot id disables the self echo check") {
        CHECK(classify_event(event, std::nullopt) == AdmissionVerdict::Admit);
    }

    SECTION("system events") {
        event.message_type = message_type::System;
        CHECK(classify_event(event, std::string("other")) == AdmissionVerdict::System);
    }

    SECTION("unsupported types") {
        for (int type : {message_type::Image, message_type::Video, message_type::File,
                         message_type::Audio}) {
            event.message_type = type;
            CHECK(classify_event(event, std::nullopt) == AdmissionVerdict::Unsupported);
        }
    }

    SECTION("text, kmarkdown and card are admitted") {
        for (int type : {message_type::Text, message_type::KMarkdown, message_type::Card}) {
            event.message_type = type;
            CHECK(classify_event(event, std::nullopt) == AdmissionVerdict::Admit);
        }
    }
}

TEST_CASE("AdmissionPipeline spawns admitted events and counts drops", "[kook][admission]") {
    boost::asio::io_context ioc;
    auto handler = std::make_shared<RecordingHandler>();
    auto pipeline = std::make_shared<AdmissionPipeline>(ioc.get_executor(), handler, "kook[test]");
    pipeline->set_bot_id(std::string("bot-1"));

    pipeline->submit(fakes::group_event("chan-1", "user-1", "hello", "m-1"));
    pipeline->submit(fakes::group_event("chan-1", "bot-1", "echo", "m-2"));

    auto system = fakes::group_event("chan-1", "user-1", "joined", "m-3");
    system["type"] = 255;
    pipeline->submit(system);

    auto image = fakes::group_event("chan-1", "user-1", "https://img", "m-4");
    image["type"] = 2;
    pipeline->submit(image);

    pipeline->submit(json{{"channel_type", "GROUP"}});
    pipeline->submit(json{{"channel_type", 7}});

    // Handler work is deferred; submit() never runs it inline.
    CHECK(handler->seen.empty());
    CHECK(pipeline->in_flight() == 1);

    ioc.run();

    REQUIRE(handler->seen == std::vector<std::string>{"m-1"});
    CHECK(handler->seen_bot_ids[0].value() == "bot-1");

    const auto& counters = pipeline->counters();
    CHECK(counters.admitted == 1);
    CHECK(counters.self_echo == 1);
    CHECK(counters.system == 1);
    CHECK(counters.unsupported == 1);
    CHECK(counters.malformed == 2);
    CHECK(counters.completed == 1);
    CHECK(counters.failed == 0);
    CHECK(pipeline->in_flight() == 0);
}

TEST_CASE("AdmissionPipeline contains handler failures", "[kook][admission]") {
    boost::asio::io_context ioc;
    auto handler = std::make_shared<RecordingHandler>();
    auto pipeline = std::make_shared<AdmissionPipeline>(ioc.get_executor(), handler, "kook[test]");

    pipeline->submit(fakes::group_event("chan-1", "user-1", "fail", "m-1"));
    pipeline->submit(fakes::group_event("chan-1", "user-1", "throw", "m-2"));
    pipeline->submit(fakes::group_event("chan-1", "user-1", "fine", "m-3"));

    REQUIRE_NOTHROW(ioc.run());

    CHECK(handler->seen.size() == 3);
    CHECK(pipeline->counters().failed == 2);
    CHECK(pipeline->counters().completed == 1);
    CHECK(pipeline->in_flight() == 0);
}
