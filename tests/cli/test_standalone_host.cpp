#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>

#include "../kook/fakes.hpp"
#include "kookbridge/cli/standalone_host.hpp"
#include "kookbridge/kook/reply_dispatcher.hpp"
#include "kookbridge/kook/sender.hpp"

using namespace kookbridge;
using namespace kookbridge::cli;
namespace fakes = kookbridge::testing;

TEST_CASE("StandaloneHost routes each peer to its own session", "[cli][host]") {
    StandaloneHost host;

    auto group = host.resolve_route(kook::RouteRequest{
        .account_id = "default",
        .peer = kook::RoutePeer{.kind = kook::PeerKind::Group, .id = "chan-1"},
    });
    REQUIRE(group.has_value());
    CHECK(group->session_key == "agent:main:kook:default:group:chan-1");
    CHECK(group->agent_id == "main");
    CHECK(group->account_id == "default");

    auto direct = host.resolve_route(kook::RouteRequest{
        .account_id = "ops",
        .peer = kook::RoutePeer{.kind = kook::PeerKind::Direct, .id = "u-1"},
    });
    REQUIRE(direct.has_value());
    CHECK(direct->session_key == "agent:main:kook:ops:direct:u-1");

    auto empty = host.resolve_route(kook::RouteRequest{.account_id = "default"});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("StandaloneHost envelope format", "[cli][host]") {
    StandaloneHost host;
    auto envelope = host.format_envelope(kook::EnvelopeParams{
        .from = "chan-1:u-1",
        .timestamp_ms = 1700000000123,
        .body = "alice: hi",
    });
    CHECK(envelope == "[KOOK chan-1:u-1 2023-11-14T22:13:20Z] alice: hi");
}

TEST_CASE("StandaloneHost dispatch", "[cli][host]") {
    boost::asio::io_context ioc;
    auto api = std::make_shared<fakes::FakeApi>();
    auto dispatcher = std::make_shared<kook::KookReplyDispatcher>(
        std::make_shared<kook::KookSender>(api),
        kook::ReplyTarget{.account_tag = "kook[default]", .conversation_id = "chan-1"});

    kook::InboundContext context;
    context.raw_body = "hello there";
    context.to = "channel:chan-1";

    SECTION("silent by default") {
        StandaloneHost host;
        auto outcome = fakes::run_sync(ioc, host.dispatch_reply(context, dispatcher));
        REQUIRE(outcome.has_value());
        CHECK_FALSE(outcome->queued_final);
        CHECK(api->channel_messages.empty());
    }

    SECTION("echo mode replies with the message text") {
        StandaloneHost host(StandaloneHostOptions{.echo = true});
        auto outcome = fakes::run_sync(ioc, host.dispatch_reply(context, dispatcher));
        REQUIRE(outcome.has_value());
        CHECK(outcome->queued_final);
        CHECK(outcome->counts.final == 1);
        REQUIRE(api->channel_messages.size() == 1);
        CHECK(api->channel_messages[0].content == "hello there");
    }

    SECTION("echo delivery failure is returned") {
        api->fail_sends = true;
        StandaloneHost host(StandaloneHostOptions{.echo = true});
        auto outcome = fakes::run_sync(ioc, host.dispatch_reply(context, dispatcher));
        CHECK_FALSE(outcome.has_value());
    }
}

TEST_CASE("StandaloneHost pairing decision", "[cli][host]") {
    boost::asio::io_context ioc;
    kook::PairingRequest request{.account_id = "default", .sender_id = "u-1"};

    StandaloneHost pending;
    auto held = fakes::run_sync(ioc, pending.authorize_pairing(request));
    REQUIRE(held.has_value());
    CHECK_FALSE(*held);

    StandaloneHost approving(StandaloneHostOptions{.auto_approve_pairing = true});
    auto approved = fakes::run_sync(ioc, approving.authorize_pairing(request));
    REQUIRE(approved.has_value());
    CHECK(*approved);
}
