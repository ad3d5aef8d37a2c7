#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include "bidirectional_channel.h"
#include "config.h"

namespace net = boost::asio;
namespace bc = bidirectional_channel;

struct ping
{
    uint64_t requester_id;
    uint64_t sequence;
};

struct pong
{
    uint64_t sequence;
    uint64_t total;
};

using ping_requester = bc::requester<ping, pong, bc::requester_sharing::shared>;
using ping_responder = bc::responder<ping, pong>;

net::awaitable<void> co_counter(ping_responder responder)
{
    uint64_t total = 0;
    auto stats = co_await bc::serve(responder, [&total](const ping &request) -> net::awaitable<pong> {
        ++total;
        SPDLOG_DEBUG("counter received ping {}:{}", request.requester_id, request.sequence);
        co_return pong{request.sequence, total};
    });

    spdlog::info("counter stopped, answered: {} ignored: {} undelivered: {}", stats.answered, stats.ignored, stats.undelivered);
}

net::awaitable<void> co_pinger(ping_requester requester, uint64_t requester_id, uint64_t requests)
{
    for (uint64_t sequence = 0; sequence < requests; ++sequence)
    {
        auto result = co_await requester.async_send(ping{requester_id, sequence});
        if (!result)
        {
            spdlog::error("pinger {} ping {} failed: {}", requester_id, sequence, result.error().message());
            co_return;
        }

        SPDLOG_DEBUG("pinger {} pong {} total {}", requester_id, result.value().sequence, result.value().total);
    }

    spdlog::info("pinger {} sent {} pings", requester_id, requests);
}

net::awaitable<void> co_main(bc::config config)
{
    auto executor = co_await net::this_coro::executor;
    auto [requester, responder] = config.unbounded() ? bc::unbounded<ping, pong, bc::requester_sharing::shared>(executor)
                                                     : bc::bounded<ping, pong, bc::requester_sharing::shared>(executor, config.capacity());

    net::co_spawn(executor, co_counter(std::move(responder)), net::detached);
    for (uint64_t requester_id = 0; requester_id < config.requesters(); ++requester_id)
    {
        net::co_spawn(executor, co_pinger(requester.clone(), requester_id, config.requests()), net::detached);
    }
}

int main(int argc, char *argv[])
{
    auto config = bc::config::from_command_line(argc, argv);
    spdlog::set_level(config.log_level());

    net::io_context io_context;

    net::co_spawn(io_context, co_main(config), [](const std::exception_ptr &exception_ptr) {
        try
        {
            if (exception_ptr != nullptr)
            {
                std::rethrow_exception(exception_ptr);
            }
        }
        catch (const std::exception &ex)
        {
            SPDLOG_ERROR("co_main exception: {}", ex.what());
        }
    });

    std::vector<std::thread> threads;
    for (uint64_t i = 1; i < config.threads(); ++i)
    {
        threads.emplace_back([&io_context]() { io_context.run(); });
    }

    io_context.run();
    for (auto &thread : threads)
    {
        thread.join();
    }

    return 0;
}
