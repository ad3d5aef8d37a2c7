#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

#include <gtest/gtest.h>

#include "bidirectional_channel.h"
#include "test_common.h"

namespace net = boost::asio;
namespace sys = boost::system;
namespace bc = bidirectional_channel;

using namespace std::chrono_literals;
using namespace net::experimental::awaitable_operators;
using bc::test::run_coroutine;
using bc::test::run_coroutine_on_threads;
using bc::test::sleep_for;
using bc::test::yield;

using length_requester = bc::requester<std::string, std::size_t, bc::requester_sharing::exclusive>;
using length_responder = bc::responder<std::string, std::size_t>;
using shared_length_requester = bc::requester<std::string, std::size_t, bc::requester_sharing::shared>;
using length_result = bc::send_result<std::string, std::size_t>;
using doubling_requester = bc::requester<uint64_t, uint64_t, bc::requester_sharing::shared>;
using doubling_responder = bc::responder<uint64_t, uint64_t>;
using doubling_result = bc::send_result<uint64_t, uint64_t>;

static_assert(!std::is_copy_constructible_v<length_requester>);
static_assert(std::is_move_constructible_v<length_requester>);
static_assert(std::is_copy_constructible_v<shared_length_requester>);
static_assert(!std::is_copy_constructible_v<length_responder>);
static_assert(!std::is_copy_constructible_v<bc::reply_obligation<std::size_t>>);
static_assert(!std::is_copy_constructible_v<bc::received_request<std::string, std::size_t>>);

namespace {

net::awaitable<std::string> respond_with_length(length_responder &responder)
{
    auto request = co_await responder.async_receive();
    EXPECT_TRUE(request.has_value());
    if (!request)
    {
        co_return std::string{};
    }

    auto length = (*request)->size();
    auto outcome = std::move(*request).respond(length);
    EXPECT_TRUE(outcome);
    co_return outcome.value();
}

net::awaitable<void> drop_one(length_responder &responder)
{
    auto request = co_await responder.async_receive();
    EXPECT_TRUE(request.has_value());
}

net::awaitable<void> request_response()
{
    auto [requester, responder] = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(co_await net::this_coro::executor, 1);

    auto [response, request] = co_await (requester.async_send("hello") && respond_with_length(responder));

    EXPECT_TRUE(response);
    EXPECT_EQ(response.value(), 5u);
    EXPECT_EQ(request, "hello");
    EXPECT_EQ(response.value(), request.size());
}

net::awaitable<void> closed_before_send()
{
    auto [requester, responder] = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(co_await net::this_coro::executor, 1);
    responder.close();
    EXPECT_TRUE(requester.is_closed());

    for (const std::string input : {"x", "y"})
    {
        auto result = co_await requester.async_send(input);
        EXPECT_FALSE(result);
        EXPECT_EQ(result.error(), bc::channel_error::closed);
        EXPECT_TRUE(result.has_returned());
        EXPECT_EQ(result.returned(), input);
    }
}

net::awaitable<void> closed_by_destruction()
{
    auto channel = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(co_await net::this_coro::executor, 1);
    {
        auto dropped = std::move(channel.second);
    }

    auto result = co_await channel.first.async_send("x");
    EXPECT_EQ(result.error(), bc::channel_error::closed);
    EXPECT_EQ(result.returned(), "x");
    EXPECT_THROW(static_cast<void>(result.value()), sys::system_error);
}

net::awaitable<void> ignored_when_dropped()
{
    auto [requester, responder] = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(co_await net::this_coro::executor, 1);

    auto result = co_await (requester.async_send("hello") && drop_one(responder));

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), bc::channel_error::ignored);
    EXPECT_FALSE(result.has_returned());
}

net::awaitable<void> drop_obligation_keep_request(length_responder &responder, std::string &kept)
{
    auto request = co_await responder.async_receive();
    auto [value, obligation] = std::move(*request).into_parts();
    kept = std::move(value);
    EXPECT_TRUE(obligation.pending());
}

net::awaitable<void> ignored_when_obligation_dropped()
{
    auto [requester, responder] = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(co_await net::this_coro::executor, 1);
    std::string kept;

    auto result = co_await (requester.async_send("hello") && drop_obligation_keep_request(responder, kept));

    EXPECT_EQ(result.error(), bc::channel_error::ignored);
    EXPECT_EQ(kept, "hello");
}

net::awaitable<void> second_send_waits_for_drain()
{
    auto executor = co_await net::this_coro::executor;
    auto channel = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(executor, 1);
    auto &requester = channel.first;
    auto &responder = channel.second;

    std::optional<length_result> first;
    net::co_spawn(
        executor, [&]() -> net::awaitable<void> { first.emplace(co_await requester.async_send("first")); }, net::detached);
    co_await yield();

    // The queue holds "first", the second enqueue cannot complete.
    auto second = co_await (requester.async_send("second") || sleep_for(50ms));
    EXPECT_EQ(second.index(), 1u);

    auto received = co_await responder.async_receive();
    EXPECT_TRUE(received.has_value());
    EXPECT_EQ(**received, "first");
    EXPECT_TRUE(std::move(*received).respond(5));

    auto [third, answered] = co_await (requester.async_send("second") && respond_with_length(responder));
    EXPECT_EQ(answered, "second");
    EXPECT_EQ(third.value(), 6u);

    co_await yield();
    EXPECT_TRUE(first.has_value());
    EXPECT_EQ(first->value(), 5u);
}

net::awaitable<void> sequential_requester(length_requester &requester)
{
    auto first = co_await requester.async_send("first");
    EXPECT_TRUE(first);
    auto second = co_await requester.async_send("second");
    EXPECT_TRUE(second);
}

net::awaitable<void> batch_responder(length_responder &responder)
{
    auto first = co_await responder.async_receive();
    auto second = co_await responder.async_receive();
    EXPECT_TRUE(std::move(*first).respond((*first)->size()));
    EXPECT_TRUE(std::move(*second).respond((*second)->size()));
}

net::awaitable<void> awaiting_each_reply_deadlocks()
{
    auto [requester, responder] = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(co_await net::this_coro::executor, 1);

    auto outcome = co_await ((sequential_requester(requester) && batch_responder(responder)) || sleep_for(100ms));

    EXPECT_EQ(outcome.index(), 1u);
}

net::awaitable<void> responder_close_resolves_pending()
{
    auto executor = co_await net::this_coro::executor;
    auto channel = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(executor, 1);
    auto &requester = channel.first;

    std::optional<length_result> buffered;
    std::optional<length_result> blocked;
    net::co_spawn(
        executor, [&]() -> net::awaitable<void> { buffered.emplace(co_await requester.async_send("buffered")); }, net::detached);
    net::co_spawn(
        executor, [&]() -> net::awaitable<void> { blocked.emplace(co_await requester.async_send("blocked")); }, net::detached);
    co_await yield();
    co_await yield();

    channel.second.close();
    co_await sleep_for(10ms);

    EXPECT_TRUE(buffered.has_value());
    EXPECT_EQ(buffered->error(), bc::channel_error::ignored);

    EXPECT_TRUE(blocked.has_value());
    EXPECT_EQ(blocked->error(), bc::channel_error::closed);
    EXPECT_EQ(blocked->returned(), "blocked");
}

net::awaitable<void> send_with_clone(shared_length_requester requester, std::string request, std::optional<length_result> &result)
{
    result.emplace(co_await requester.async_send(std::move(request)));
}

net::awaitable<void> replies_are_paired_per_call()
{
    constexpr std::size_t count = 16;
    auto executor = co_await net::this_coro::executor;
    auto [requester, responder] = bc::unbounded<std::string, std::size_t, bc::requester_sharing::shared>(executor);

    std::vector<std::optional<length_result>> results(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        net::co_spawn(executor, send_with_clone(requester.clone(), std::to_string(i), results[i]), net::detached);
    }

    std::vector<bc::received_request<std::string, std::size_t>> received;
    for (std::size_t i = 0; i < count; ++i)
    {
        auto request = co_await responder.async_receive();
        EXPECT_TRUE(request.has_value());
        EXPECT_EQ(request->request(), std::to_string(i));
        received.emplace_back(std::move(*request));
    }

    // Answer in reverse order of arrival.
    while (!received.empty())
    {
        auto request = std::move(received.back());
        received.pop_back();
        auto reply = std::stoul(*request) * 10;
        EXPECT_TRUE(std::move(request).respond(reply));
    }

    co_await sleep_for(10ms);
    for (std::size_t i = 0; i < count; ++i)
    {
        EXPECT_TRUE(results[i].has_value());
        EXPECT_EQ(results[i]->value(), i * 10);
    }
}

net::awaitable<void> receive_ends_after_last_requester()
{
    auto executor = co_await net::this_coro::executor;
    auto [requester, responder] = bc::bounded<std::string, std::size_t, bc::requester_sharing::shared>(executor, 4);

    std::optional<length_result> first;
    std::optional<length_result> second;
    net::co_spawn(executor, send_with_clone(requester.clone(), "a", first), net::detached);
    net::co_spawn(executor, send_with_clone(requester, "bb", second), net::detached);
    {
        auto released = std::move(requester);
    }
    EXPECT_TRUE(responder.is_open());

    std::size_t answered = 0;
    while (auto request = co_await responder.async_receive())
    {
        auto length = (*request)->size();
        EXPECT_TRUE(std::move(*request).respond(length));
        ++answered;
    }

    EXPECT_EQ(answered, 2u);
    EXPECT_FALSE(responder.is_open());
    EXPECT_EQ(first->value(), 1u);
    EXPECT_EQ(second->value(), 2u);
}

net::awaitable<void> respond_after_requester_gave_up()
{
    auto executor = co_await net::this_coro::executor;
    auto channel = bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(executor, 1);
    auto &requester = channel.first;
    auto &responder = channel.second;

    std::optional<std::variant<length_result, std::monostate>> outcome;
    net::co_spawn(
        executor, [&]() -> net::awaitable<void> { outcome.emplace(co_await (requester.async_send("late") || sleep_for(20ms))); }, net::detached);

    auto request = co_await responder.async_receive();
    EXPECT_TRUE(request.has_value());
    co_await sleep_for(50ms);

    EXPECT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->index(), 1u);

    auto late = std::move(*request).respond(4);
    EXPECT_FALSE(late);
    EXPECT_EQ(late.error(), bc::channel_error::requester_gone);
    EXPECT_EQ(late.returned().first, "late");
    EXPECT_EQ(late.returned().second, 4u);
}

net::awaitable<void> unbounded_never_waits()
{
    auto executor = co_await net::this_coro::executor;
    auto [requester, responder] = bc::unbounded<std::string, std::size_t, bc::requester_sharing::shared>(executor);

    constexpr std::size_t count = 64;
    std::vector<std::optional<length_result>> results(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        net::co_spawn(executor, send_with_clone(requester.clone(), std::string(i, 'x'), results[i]), net::detached);
    }
    co_await sleep_for(10ms);

    // Every request was enqueued without a single receive.
    for (std::size_t i = 0; i < count; ++i)
    {
        auto request = co_await responder.async_receive();
        EXPECT_EQ((*request)->size(), i);
        EXPECT_TRUE(std::move(*request).respond((*request)->size()));
    }

    co_await sleep_for(10ms);
    for (std::size_t i = 0; i < count; ++i)
    {
        EXPECT_EQ(results[i]->value(), i);
    }
}

struct send_tally
{
    std::atomic<uint64_t> replied{0};
    std::atomic<uint64_t> ignored{0};
    std::atomic<uint64_t> abandoned{0};
    std::atomic<uint64_t> unexpected{0};
};

// Every fourth call gives up after 1ms.
net::awaitable<void> send_doubles(doubling_requester requester, uint64_t first, uint64_t count, std::shared_ptr<send_tally> seen)
{
    for (uint64_t id = first; id < first + count; ++id)
    {
        std::optional<doubling_result> result;
        if (id % 4 == 0)
        {
            auto raced = co_await (requester.async_send(id) || sleep_for(1ms));
            if (raced.index() == 1)
            {
                ++seen->abandoned;
                continue;
            }
            result.emplace(std::move(std::get<0>(raced)));
        }
        else
        {
            result.emplace(co_await requester.async_send(id));
        }

        if (*result && result->value() == id * 2)
        {
            ++seen->replied;
        }
        else if (!*result && result->error() == bc::channel_error::ignored)
        {
            ++seen->ignored;
        }
        else
        {
            ++seen->unexpected;
        }
    }
}

net::awaitable<void> shared_clones_across_threads()
{
    constexpr uint64_t clones = 8;
    constexpr uint64_t per_clone = 16;
    auto executor = co_await net::this_coro::executor;
    auto queue = std::make_shared<doubling_responder::queue_type>(executor, 4);
    auto seen = std::make_shared<send_tally>();

    {
        doubling_requester requester(queue);
        for (uint64_t clone = 0; clone < clones; ++clone)
        {
            net::co_spawn(executor, send_doubles(requester.clone(), clone * 100, per_clone, seen), net::detached);
        }
        // Nothing is answered yet, so every clone is still alive.
        EXPECT_EQ(queue->requesters(), clones + 1);
    }

    doubling_responder responder(queue);
    uint64_t undelivered = 0;
    while (auto request = co_await responder.async_receive())
    {
        const uint64_t id = **request;
        if (id % 5 == 0)
        {
            continue;
        }
        if (id % 3 == 0)
        {
            co_await sleep_for(2ms);
        }

        auto outcome = std::move(*request).respond(id * 2);
        if (!outcome)
        {
            EXPECT_EQ(outcome.error(), bc::channel_error::requester_gone);
            ++undelivered;
        }
    }

    EXPECT_EQ(queue->requesters(), 0u);
    EXPECT_FALSE(responder.is_open());
    EXPECT_EQ(seen->unexpected.load(), 0u);
    EXPECT_EQ(seen->replied.load() + seen->ignored.load() + seen->abandoned.load(), clones * per_clone);
    EXPECT_LE(undelivered, seen->abandoned.load());
    EXPECT_GT(seen->replied.load(), 0u);
}

} // namespace

TEST(channel, request_response)
{
    run_coroutine(request_response());
}

TEST(channel, closed_before_send_returns_request)
{
    run_coroutine(closed_before_send());
}

TEST(channel, closed_when_responder_destroyed)
{
    run_coroutine(closed_by_destruction());
}

TEST(channel, ignored_when_request_dropped)
{
    run_coroutine(ignored_when_dropped());
}

TEST(channel, ignored_when_obligation_dropped)
{
    run_coroutine(ignored_when_obligation_dropped());
}

TEST(channel, second_send_waits_for_drain)
{
    run_coroutine(second_send_waits_for_drain());
}

TEST(channel, awaiting_each_reply_deadlocks_on_capacity_one)
{
    run_coroutine(awaiting_each_reply_deadlocks());
}

TEST(channel, responder_close_resolves_pending_sends)
{
    run_coroutine(responder_close_resolves_pending());
}

TEST(channel, replies_are_paired_per_call)
{
    run_coroutine(replies_are_paired_per_call());
}

TEST(channel, receive_ends_after_last_requester)
{
    run_coroutine(receive_ends_after_last_requester());
}

TEST(channel, respond_after_requester_gave_up)
{
    run_coroutine(respond_after_requester_gave_up());
}

TEST(channel, unbounded_never_waits)
{
    run_coroutine(unbounded_never_waits());
}

TEST(channel, bounded_rejects_zero_capacity)
{
    net::io_context io_context;
    EXPECT_THROW(static_cast<void>(bc::bounded<std::string, std::size_t, bc::requester_sharing::exclusive>(io_context.get_executor(), 0)), std::invalid_argument);
}

TEST(channel, shared_clones_across_threads)
{
    run_coroutine_on_threads(shared_clones_across_threads(), 4);
}
