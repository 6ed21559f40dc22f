#include "kookbridge/cli/commands.hpp"
#include "kookbridge/cli/standalone_host.hpp"
#include "kookbridge/channels/kook.hpp"
#include "kookbridge/core/abort.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/kook/account.hpp"
#include "kookbridge/kook/client.hpp"
#include "kookbridge/kook/monitor.hpp"
#include "kookbridge/kook/probe.hpp"
#include "kookbridge/version.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

namespace kookbridge::cli {

using json = nlohmann::json;

namespace {

/// Runs `coro` to completion on `ioc`; exceptions resurface here.
template <typename T>
auto run_blocking(boost::asio::io_context& ioc, boost::asio::awaitable<T> coro) -> T {
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(coro),
        [&result, &error](std::exception_ptr ep, T value) {
            error = ep;
            if (!ep) {
                result.emplace(std::move(value));
            }
        });
    ioc.run();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(*result);
}

/// Prints `error` and ends the process with exit code 1.
[[noreturn]] void fail_command(const Error& error) {
    std::cerr << "error: " << error.what() << "\n";
    throw CLI::RuntimeError(1);
}

auto account_summary(const kook::AccountView& account) -> json {
    json j = {
        {"account_id", account.account_id},
        {"enabled", account.enabled},
        {"configured", account.configured},
        {"token_source", kook::token_source_name(account.token_source)},
        {"dm_policy", account.dm_policy},
        {"allow_from", account.allow_from},
        {"group_policy", account.group_policy},
        {"group_allow_from", account.group_allow_from},
        {"require_mention", account.require_mention},
        {"text_chunk_limit", account.text_chunk_limit},
        {"history_limit", account.history_limit},
        {"groups", account.groups.size()},
        {"warnings", kook::collect_warnings(account)},
    };
    if (account.name) j["name"] = *account.name;
    return j;
}

struct RunCommandOptions {
    std::string account;
    bool echo = false;
    bool auto_pair = false;
};

struct ProbeCommandOptions {
    std::string account;
};

struct SendCommandOptions {
    std::string account;
    std::string to;
    std::string text;
    std::string reply_to;
    std::string media;
};

} // anonymous namespace

void CommandContext::prepare() {
    if (!config_path.empty()) {
        config = load_config(std::filesystem::path(config_path));
    } else {
        config = load_config_from_env();
    }
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
    Logger::init("kookbridge", config.log_level);
    if (!config_path.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path);
    }
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("run", "Monitor KOOK accounts until interrupted");
    auto opts = std::make_shared<RunCommandOptions>();

    sub->add_option("-a,--account", opts->account,
                    "Account to monitor (default: all enabled accounts)");
    sub->add_flag("--echo", opts->echo,
                  "Reply to every admitted message with its own text");
    sub->add_flag("--auto-pair", opts->auto_pair,
                  "Approve DMs held for pairing without review");

    sub->callback([&ctx, opts]() {
        ctx.prepare();

        boost::asio::io_context ioc;
        AbortSignal abort;

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&abort](auto ec, int sig) {
            if (!ec) {
                LOG_INFO("Received shutdown signal ({})", sig);
                abort.abort();
            }
        });

        auto config = ctx.config;
        kook::MonitorOptions options{
            .config = [config] { return config; },
            .host = std::make_shared<StandaloneHost>(StandaloneHostOptions{
                .echo = opts->echo,
                .auto_approve_pairing = opts->auto_pair,
            }),
            .abort = &abort,
        };
        if (!opts->account.empty()) {
            options.account_id = opts->account;
        }

        LOG_INFO("Starting kookbridge {}. Press Ctrl+C to stop.", KOOKBRIDGE_VERSION_STRING);

        auto result = run_blocking(ioc,
            [&]() -> boost::asio::awaitable<Result<void>> {
                auto outcome = co_await kook::monitor_kook(ioc, std::move(options));
                boost::system::error_code ignored;
                signals.cancel(ignored);
                co_return outcome;
            }());
        if (!result) {
            fail_command(result.error());
        }

        LOG_INFO("kookbridge stopped.");
    });
}

// ---------------------------------------------------------------------------
// probe command
// ---------------------------------------------------------------------------

void register_probe_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("probe", "Verify an account's bot token");
    auto opts = std::make_shared<ProbeCommandOptions>();

    sub->add_option("-a,--account", opts->account, "Account to probe (default account if omitted)");

    sub->callback([&ctx, opts]() {
        ctx.prepare();

        auto account = kook::resolve_account(
            ctx.config, opts->account.empty() ? kook::default_account_id(ctx.config) : opts->account);

        boost::asio::io_context ioc;
        kook::KookRestClient api(ioc, account.token);
        auto probe = run_blocking(ioc, kook::probe_bot(api, account.token));

        json j = probe;
        j["account_id"] = account.account_id;
        std::cout << j.dump(2) << "\n";
        if (!probe.ok) {
            throw CLI::RuntimeError(1);
        }
    });
}

// ---------------------------------------------------------------------------
// send command
// ---------------------------------------------------------------------------

void register_send_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("send", "Send a message to a KOOK channel or user");
    auto opts = std::make_shared<SendCommandOptions>();

    sub->add_option("-t,--to", opts->to,
                    "Target: channel:<id>, user:<id>, or a DM chat code")
        ->required();
    sub->add_option("-m,--text", opts->text, "Message text (KMarkdown)");
    sub->add_option("--media", opts->media, "Media URL sent after the text");
    sub->add_option("-a,--account", opts->account, "Sending account (default account if omitted)");
    sub->add_option("--reply-to", opts->reply_to, "Message id to quote");

    sub->callback([&ctx, opts]() {
        ctx.prepare();

        if (opts->text.empty() && opts->media.empty()) {
            fail_command(make_error(ErrorCode::InvalidArgument, "Nothing to send: pass --text or --media"));
        }

        auto config = ctx.config;
        auto account_id = opts->account.empty() ? kook::default_account_id(config) : opts->account;

        boost::asio::io_context ioc;
        channels::KookChannel channel(channels::KookChannelOptions{
            .config = [config] { return config; },
            .account_id = account_id,
        }, ioc);

        channels::OutgoingMessage msg;
        msg.channel = std::string(kook::kChannelId);
        msg.account_id = account_id;
        msg.recipient_id = opts->to;
        msg.text = opts->text;
        if (!opts->media.empty()) msg.media_url = opts->media;
        if (!opts->reply_to.empty()) msg.reply_to = opts->reply_to;

        auto result = run_blocking(ioc, channel.send(std::move(msg)));
        if (!result) {
            fail_command(result.error());
        }
        std::cout << "sent\n";
    });
}

// ---------------------------------------------------------------------------
// accounts command
// ---------------------------------------------------------------------------

void register_accounts_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("accounts", "List configured KOOK accounts");

    sub->callback([&ctx]() {
        ctx.prepare();

        std::vector<kook::AccountView> accounts;
        json list = json::array();
        for (const auto& id : kook::list_account_ids(ctx.config)) {
            auto account = kook::resolve_account(ctx.config, id);
            list.push_back(account_summary(account));
            accounts.push_back(std::move(account));
        }

        json j = {
            {"default_account", kook::default_account_id(ctx.config)},
            {"accounts", list},
            {"issues", kook::collect_status_issues(accounts)},
        };
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "kookbridge " << KOOKBRIDGE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace kookbridge::cli
