#include "kookbridge/kook/monitor.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/kook/admission.hpp"
#include "kookbridge/kook/supervisor.hpp"

#include <exception>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace kookbridge::kook {

namespace {

// Carries the tag of each account supervisor as it stops.
using StoppedChannel = boost::asio::experimental::concurrent_channel<
    void(boost::system::error_code, std::string)>;

auto select_accounts(const Config& config, const std::optional<std::string>& account_id)
    -> Result<std::vector<AccountView>> {
    std::vector<AccountView> accounts;

    if (account_id) {
        auto account = resolve_account(config, *account_id);
        if (!account.enabled || !account.configured) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "KOOK account \"" + account.account_id + "\" not configured or disabled"));
        }
        accounts.push_back(std::move(account));
        return accounts;
    }

    accounts = list_enabled_accounts(config);
    for (const auto& account : accounts) {
        if (account.token.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "KOOK account \"" + account.account_id + "\" has no bot token",
                "set channels.kook.token or KOOK_BOT_TOKEN"));
        }
    }
    return accounts;
}

} // anonymous namespace

auto monitor_kook(boost::asio::io_context& ioc, MonitorOptions options)
    -> boost::asio::awaitable<Result<void>> {
    if (!options.config) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig,
                                       "Config is required for KOOK monitor"));
    }
    if (!options.host) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Host runtime is required for KOOK monitor"));
    }
    if (!options.abort) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Abort signal is required for KOOK monitor"));
    }

    auto accounts = select_accounts(options.config(), options.account_id);
    if (!accounts) {
        co_return make_fail(accounts.error());
    }
    if (accounts->empty()) {
        LOG_WARN("kook: no enabled accounts found");
        co_return ok_result();
    }

    auto stopped = std::make_shared<StoppedChannel>(ioc, accounts->size());

    for (const auto& account : *accounts) {
        const auto tag = account.tag();
        for (const auto& warning : collect_warnings(account)) {
            LOG_WARN("{}: {}", tag, warning);
        }

        boost::asio::any_io_executor strand = boost::asio::make_strand(ioc);

        std::shared_ptr<KookApi> api = options.make_api
            ? options.make_api(account)
            : std::make_shared<KookRestClient>(ioc, account.token);
        std::shared_ptr<GatewayConnector> connector = options.make_connector
            ? options.make_connector(strand)
            : std::make_shared<BeastConnector>(strand);

        auto handler = std::make_shared<InboundHandler>(
            options.config, account.account_id, options.host, api);
        auto pipeline = std::make_shared<AdmissionPipeline>(strand, handler, tag);

        auto hooks = options.hooks;
        hooks.on_identity = [pipeline, user_hook = options.hooks.on_identity](
                                const std::optional<std::string>& bot_id) {
            pipeline->set_bot_id(bot_id);
            if (user_hook) {
                user_hook(bot_id);
            }
        };

        auto supervisor = std::make_shared<GatewaySupervisor>(
            strand, api, connector, options.timings,
            [pipeline](json payload) { pipeline->submit(std::move(payload)); },
            std::move(hooks), tag);

        LOG_INFO("{}: starting monitor ({})", tag, account.name.value_or(account.account_id));

        boost::asio::co_spawn(
            strand,
            [supervisor, abort = options.abort]() -> boost::asio::awaitable<void> {
                co_await supervisor->run(*abort);
            },
            [stopped, pipeline, tag](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        LOG_ERROR("{}: gateway supervisor failed: {}", tag, e.what());
                    } catch (...) {
                        LOG_ERROR("{}: gateway supervisor failed: unknown exception", tag);
                    }
                }
                LOG_INFO("{}: monitor stopped ({} handled, {} failed, {} in flight)",
                         tag, pipeline->counters().completed,
                         pipeline->counters().failed, pipeline->in_flight());
                if (!stopped->try_send(boost::system::error_code{}, tag)) {
                    LOG_WARN("{}: stop notice dropped", tag);
                }
            });
    }

    for (std::size_t i = 0; i < accounts->size(); ++i) {
        auto tag = co_await stopped->async_receive(boost::asio::use_awaitable);
        LOG_DEBUG("{}: supervisor joined", tag);
    }

    co_return ok_result();
}

} // namespace kookbridge::kook
