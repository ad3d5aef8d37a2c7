#ifndef BIDIRECTIONAL_CHANNEL_DETAIL_REPLY_SLOT_H
#define BIDIRECTIONAL_CHANNEL_DETAIL_REPLY_SLOT_H

// std
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

// boost
#include <boost/asio/awaitable.hpp>
#include <boost/noncopyable.hpp>

// spdlog
#include <spdlog/spdlog.h>

// module
#include "types.h"

namespace bidirectional_channel::detail {

// One-shot slot carrying a single reply from an obligation to the waiting requester.
template<reply_value Reply>
class reply_state : public boost::noncopyable
{
public:
    explicit reply_state(const net::any_io_executor &executor);

    // Moves from reply only when it was delivered.
    bool try_deliver(Reply &reply);

    void abandon_sender();

    void abandon_receiver();

    net::awaitable<std::optional<Reply>> async_receive(sys::error_code &error_code);

    [[nodiscard]] uint64_t id() const noexcept;

private:
    std::mutex mutex_;
    reply_channel_t<Reply> channel_;
    bool receiver_alive_{true};
    const uint64_t id_;

    static inline std::atomic<uint64_t> reply_id_max_{1};
};

template<reply_value Reply>
reply_state<Reply>::reply_state(const net::any_io_executor &executor)
    : channel_(executor, REPLY_CAPACITY)
    , id_(reply_id_max_++)
{}

template<reply_value Reply>
bool reply_state<Reply>::try_deliver(Reply &reply)
{
    std::lock_guard lock(mutex_);
    if (!receiver_alive_ || !channel_.is_open() || channel_.ready())
    {
        SPDLOG_TRACE("reply {} try_deliver refused, receiver alive: {}", id_, receiver_alive_);
        return false;
    }

    // Open and empty with room for one message, the send below cannot fail.
    const bool delivered = channel_.try_send(sys::error_code{}, std::optional<Reply>(std::move(reply)));
    SPDLOG_TRACE("reply {} try_deliver delivered: {}", id_, delivered);
    return delivered;
}

template<reply_value Reply>
void reply_state<Reply>::abandon_sender()
{
    std::lock_guard lock(mutex_);
    SPDLOG_TRACE("reply {} abandoned by sender", id_);
    channel_.close();
}

template<reply_value Reply>
void reply_state<Reply>::abandon_receiver()
{
    std::lock_guard lock(mutex_);
    receiver_alive_ = false;
    channel_.close();
}

template<reply_value Reply>
net::awaitable<std::optional<Reply>> reply_state<Reply>::async_receive(sys::error_code &error_code)
{
    co_return co_await channel_.async_receive(await_error_code(error_code));
}

template<reply_value Reply>
uint64_t reply_state<Reply>::id() const noexcept
{
    return id_;
}

// Receiving half, owned by the requester coroutine for the lifetime of one call.
template<reply_value Reply>
class reply_receiver : public boost::noncopyable
{
public:
    explicit reply_receiver(std::shared_ptr<reply_state<Reply>> state)
        : state_(std::move(state))
    {}

    reply_receiver(reply_receiver &&other) noexcept
        : state_(std::move(other.state_))
    {}

    ~reply_receiver()
    {
        if (state_ != nullptr)
        {
            state_->abandon_receiver();
        }
    }

    net::awaitable<std::optional<Reply>> async_receive(sys::error_code &error_code)
    {
        auto state = state_;
        co_return co_await state->async_receive(error_code);
    }

private:
    std::shared_ptr<reply_state<Reply>> state_;
};

} // namespace bidirectional_channel::detail

#endif // BIDIRECTIONAL_CHANNEL_DETAIL_REPLY_SLOT_H
