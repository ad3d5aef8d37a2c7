#ifndef BIDIRECTIONAL_CHANNEL_CHANNEL_H
#define BIDIRECTIONAL_CHANNEL_CHANNEL_H

// std
#include <memory>
#include <stdexcept>
#include <utility>

// boost
#include <boost/asio/any_io_executor.hpp>

// module
#include "detail/queue_state.h"
#include "detail/types.h"
#include "error_code.h"
#include "received_request.h"
#include "reply_obligation.h"
#include "requester.h"
#include "responder.h"
#include "result.h"

namespace bidirectional_channel {

template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
using channel_pair = std::pair<requester<Request, Reply, Sharing>, responder<Request, Reply>>;

/// Create a requester-responder pair over a queue holding at most capacity
/// requests. Once full, senders suspend until the responder receives.
template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
channel_pair<Request, Reply, Sharing> bounded(const net::any_io_executor &executor, std::size_t capacity)
{
    if (capacity == 0)
    {
        throw std::invalid_argument("bounded channel capacity must be positive");
    }

    auto queue = std::make_shared<detail::queue_state<received_request<Request, Reply>>>(executor, capacity);
    return {requester<Request, Reply, Sharing>(queue), responder<Request, Reply>(queue)};
}

/// Create a requester-responder pair whose senders never wait for queue space.
template<detail::request_value Request, detail::reply_value Reply, requester_sharing Sharing>
channel_pair<Request, Reply, Sharing> unbounded(const net::any_io_executor &executor)
{
    auto queue = std::make_shared<detail::queue_state<received_request<Request, Reply>>>(executor, detail::UNBOUNDED_CAPACITY);
    return {requester<Request, Reply, Sharing>(queue), responder<Request, Reply>(queue)};
}

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_CHANNEL_H
