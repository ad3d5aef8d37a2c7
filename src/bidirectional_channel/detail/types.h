#ifndef BIDIRECTIONAL_CHANNEL_DETAIL_TYPES_H
#define BIDIRECTIONAL_CHANNEL_DETAIL_TYPES_H

// std
#include <limits>
#include <memory>
#include <optional>

// boost
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

// module
#include "type_requirements.h"

namespace bidirectional_channel {

enum class requester_sharing
{
    exclusive = 1,
    shared = 2
};

} // namespace bidirectional_channel

namespace bidirectional_channel::detail {
namespace net = boost::asio;
namespace sys = boost::system;

// Channel signatures carry default constructible payloads, a closed channel
// completes receive operations with value initialized arguments.
template<typename Envelope>
using queue_channel_t = net::experimental::concurrent_channel<void(sys::error_code, std::shared_ptr<Envelope>)>;

template<typename Reply>
using reply_channel_t = net::experimental::concurrent_channel<void(sys::error_code, std::optional<Reply>)>;

constexpr std::size_t UNBOUNDED_CAPACITY = std::numeric_limits<std::size_t>::max();
constexpr std::size_t REPLY_CAPACITY = 1;

struct await_error_code_t
{
    net::redirect_error_t<net::use_awaitable_t<>> operator()(sys::error_code &ec) const noexcept
    {
        return net::redirect_error(net::use_awaitable, ec);
    }

    net::use_awaitable_t<> operator()() const noexcept
    {
        return net::use_awaitable;
    }
};

constexpr await_error_code_t await_error_code;

} // namespace bidirectional_channel::detail

#endif // BIDIRECTIONAL_CHANNEL_DETAIL_TYPES_H
