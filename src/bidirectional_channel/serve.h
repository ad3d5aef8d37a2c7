#ifndef BIDIRECTIONAL_CHANNEL_SERVE_H
#define BIDIRECTIONAL_CHANNEL_SERVE_H

// std
#include <concepts>
#include <functional>
#include <optional>

// boost
#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>

// spdlog
#include <spdlog/spdlog.h>

// module
#include "responder.h"

namespace bidirectional_channel {
namespace net = boost::asio;

struct serve_stats
{
    uint64_t answered{0};
    uint64_t ignored{0};
    uint64_t undelivered{0};
};

template<typename Handler, typename Request, typename Reply>
concept request_handler = requires(Handler &handler, Request &request) {
    { std::invoke(handler, request) } -> std::same_as<net::awaitable<Reply>>;
};

/// Answer every request arriving on incoming with the reply produced by handler,
/// until all requesters are gone. A handler exception drops the request
/// unanswered.
template<detail::request_value Request, detail::reply_value Reply, typename Handler>
    requires request_handler<Handler, Request, Reply>
net::awaitable<serve_stats> serve(responder<Request, Reply> &incoming, Handler handler)
{
    serve_stats stats;
    SPDLOG_DEBUG("serve started");

    while (auto received = co_await incoming.async_receive())
    {
        std::optional<Reply> reply;
        try
        {
            reply.emplace(co_await std::invoke(handler, received->request()));
        }
        catch (const sys::system_error &e)
        {
            SPDLOG_ERROR("serve handler system error, code: {} what: \"{}\"", e.code().value(), e.what());
        }
        catch (const std::exception &e)
        {
            SPDLOG_ERROR("serve handler exception, what: \"{}\"", e.what());
        }

        if (!reply.has_value())
        {
            ++stats.ignored;
            continue;
        }

        auto outcome = std::move(*received).respond(std::move(*reply));
        if (!outcome)
        {
            SPDLOG_WARN("serve reply undelivered: {}", outcome.error().message());
            ++stats.undelivered;
            continue;
        }

        ++stats.answered;
    }

    SPDLOG_DEBUG("serve stopped answered: {} ignored: {} undelivered: {}", stats.answered, stats.ignored, stats.undelivered);
    co_return stats;
}

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_SERVE_H
