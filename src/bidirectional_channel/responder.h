#ifndef BIDIRECTIONAL_CHANNEL_RESPONDER_H
#define BIDIRECTIONAL_CHANNEL_RESPONDER_H

// std
#include <memory>
#include <optional>

// boost
#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>

// spdlog
#include <spdlog/spdlog.h>

// module
#include "detail/queue_state.h"
#include "detail/types.h"
#include "received_request.h"

namespace bidirectional_channel {
namespace net = boost::asio;

/// Receiving side of a channel pair.
template<detail::request_value Request, detail::reply_value Reply>
class responder
{
public:
    using request_type = Request;
    using reply_type = Reply;
    using received_type = received_request<Request, Reply>;
    using queue_type = detail::queue_state<received_type>;

    explicit responder(std::shared_ptr<queue_type> queue);

    responder(const responder &) = delete;

    responder &operator=(const responder &) = delete;

    responder(responder &&other) noexcept;

    responder &operator=(responder &&other) noexcept;

    ~responder();

    /// Next request in FIFO order, or std::nullopt once every requester is gone
    /// and the queue is drained.
    net::awaitable<std::optional<received_type>> async_receive();

    /// Stop accepting requests. Requests still buffered are dropped unanswered.
    void close();

    [[nodiscard]] bool is_open() const noexcept;

private:
    std::shared_ptr<queue_type> queue_;
};

template<detail::request_value Request, detail::reply_value Reply>
responder<Request, Reply>::responder(std::shared_ptr<queue_type> queue)
    : queue_(std::move(queue))
{}

template<detail::request_value Request, detail::reply_value Reply>
responder<Request, Reply>::responder(responder &&other) noexcept
    : queue_(std::move(other.queue_))
{}

template<detail::request_value Request, detail::reply_value Reply>
responder<Request, Reply> &responder<Request, Reply>::operator=(responder &&other) noexcept
{
    if (this != &other)
    {
        close();
        queue_ = std::move(other.queue_);
    }
    return *this;
}

template<detail::request_value Request, detail::reply_value Reply>
responder<Request, Reply>::~responder()
{
    close();
}

template<detail::request_value Request, detail::reply_value Reply>
net::awaitable<std::optional<typename responder<Request, Reply>::received_type>> responder<Request, Reply>::async_receive()
{
    auto queue = queue_;
    if (queue == nullptr)
    {
        co_return std::nullopt;
    }

    sys::error_code error_code;
    auto envelope = co_await queue->channel().async_receive(detail::await_error_code(error_code));
    SPDLOG_TRACE("queue {} async_receive: {}", queue->id(), error_code.message());

    if (error_code == net::experimental::error::channel_closed)
    {
        co_return std::nullopt;
    }

    if (error_code)
    {
        throw sys::system_error(error_code);
    }

    co_return std::move(*envelope);
}

template<detail::request_value Request, detail::reply_value Reply>
void responder<Request, Reply>::close()
{
    if (queue_ != nullptr)
    {
        queue_->close_responder();
        queue_.reset();
    }
}

template<detail::request_value Request, detail::reply_value Reply>
bool responder<Request, Reply>::is_open() const noexcept
{
    return queue_ != nullptr && queue_->is_open();
}

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_RESPONDER_H
