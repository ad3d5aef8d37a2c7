#ifndef BIDIRECTIONAL_CHANNEL_REQUESTER_H
#define BIDIRECTIONAL_CHANNEL_REQUESTER_H

// std
#include <memory>

// boost
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

// spdlog
#include <spdlog/spdlog.h>

// module
#include "detail/error_code.h"
#include "detail/queue_state.h"
#include "detail/types.h"
#include "received_request.h"
#include "reply_obligation.h"
#include "result.h"

namespace bidirectional_channel {
namespace net = boost::asio;

/// Outcome of requester::async_send: the reply, or channel_error::closed with
/// the request handed back, or channel_error::ignored.
template<typename Request, typename Reply>
using send_result = result<Reply, Request>;

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
class requester
{
public:
    using request_type = Request;
    using reply_type = Reply;
    using queue_type = detail::queue_state<received_request<Request, Reply>>;

    explicit requester(std::shared_ptr<queue_type> queue);

    requester(const requester &other)
        requires(Sharing == requester_sharing::shared);

    requester &operator=(const requester &other)
        requires(Sharing == requester_sharing::shared);

    requester(requester &&other) noexcept;

    requester &operator=(requester &&other) noexcept;

    ~requester();

    [[nodiscard]] requester clone() const
        requires(Sharing == requester_sharing::shared);

    /// Enqueue the request and wait for the correlated reply.
    /// Suspends while a bounded queue is full. The requester must outlive the call.
    net::awaitable<send_result<Request, Reply>> async_send(Request request) const;

    /// True once the responder side is gone and no send can succeed.
    [[nodiscard]] bool is_closed() const noexcept;

private:
    void release();

    std::shared_ptr<queue_type> queue_;
};

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing>::requester(std::shared_ptr<queue_type> queue)
    : queue_(std::move(queue))
{
    if (queue_ != nullptr)
    {
        queue_->acquire_requester();
    }
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing>::requester(const requester &other)
    requires(Sharing == requester_sharing::shared)
    : queue_(other.queue_)
{
    if (queue_ != nullptr)
    {
        queue_->acquire_requester();
    }
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing> &requester<Request, Reply, Sharing>::operator=(const requester &other)
    requires(Sharing == requester_sharing::shared)
{
    if (this != &other)
    {
        release();
        queue_ = other.queue_;
        if (queue_ != nullptr)
        {
            queue_->acquire_requester();
        }
    }
    return *this;
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing>::requester(requester &&other) noexcept
    : queue_(std::move(other.queue_))
{}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing> &requester<Request, Reply, Sharing>::operator=(requester &&other) noexcept
{
    if (this != &other)
    {
        release();
        queue_ = std::move(other.queue_);
    }
    return *this;
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing>::~requester()
{
    release();
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
requester<Request, Reply, Sharing> requester<Request, Reply, Sharing>::clone() const
    requires(Sharing == requester_sharing::shared)
{
    return requester(*this);
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
net::awaitable<send_result<Request, Reply>> requester<Request, Reply, Sharing>::async_send(Request request) const
{
    auto queue = queue_;
    if (queue == nullptr)
    {
        co_return send_result<Request, Reply>{detail::channel_error::closed, std::move(request)};
    }

    auto executor = co_await net::this_coro::executor;
    auto [obligation, receiver] = detail::make_reply_slot<Reply>(executor);

    // Kept until the enqueue completes so a rejected request can be handed back.
    auto envelope = std::make_shared<received_request<Request, Reply>>(std::move(request), std::move(obligation));

    sys::error_code error_code;
    co_await queue->channel().async_send({}, envelope, detail::await_error_code(error_code));
    SPDLOG_TRACE("queue {} async_send enqueue: {}", queue->id(), error_code.message());

    if (error_code == net::experimental::error::channel_closed)
    {
        auto [rejected, unanswered] = std::move(*envelope).into_parts();
        co_return send_result<Request, Reply>{detail::channel_error::closed, std::move(rejected)};
    }

    if (error_code)
    {
        throw sys::system_error(error_code);
    }

    envelope.reset();

    auto reply = co_await receiver.async_receive(error_code);
    SPDLOG_TRACE("queue {} async_send reply: {}", queue->id(), error_code.message());

    if (error_code == net::experimental::error::channel_closed)
    {
        co_return send_result<Request, Reply>{detail::channel_error::ignored};
    }

    if (error_code)
    {
        throw sys::system_error(error_code);
    }

    co_return send_result<Request, Reply>{std::move(*reply)};
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
bool requester<Request, Reply, Sharing>::is_closed() const noexcept
{
    return queue_ == nullptr || !queue_->is_open();
}

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
void requester<Request, Reply, Sharing>::release()
{
    if (queue_ != nullptr)
    {
        queue_->release_requester();
        queue_.reset();
    }
}

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_REQUESTER_H
