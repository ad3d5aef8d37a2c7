#ifndef BIDIRECTIONAL_CHANNEL_RECEIVED_REQUEST_H
#define BIDIRECTIONAL_CHANNEL_RECEIVED_REQUEST_H

// std
#include <utility>

// module
#include "detail/type_requirements.h"
#include "reply_obligation.h"
#include "result.h"

namespace bidirectional_channel {

/// A request as seen by the responder, paired with the obligation to answer it.
/// Dereferences to the request itself.
template<detail::request_value Request, detail::reply_value Reply>
class received_request
{
public:
    using request_type = Request;
    using reply_type = Reply;

    received_request(Request request, reply_obligation<Reply> obligation);

    received_request(received_request &&other) noexcept = default;

    received_request &operator=(received_request &&other) noexcept = default;

    [[nodiscard]] Request &request() noexcept;

    [[nodiscard]] const Request &request() const noexcept;

    Request &operator*() noexcept;

    const Request &operator*() const noexcept;

    Request *operator->() noexcept;

    const Request *operator->() const noexcept;

    [[nodiscard]] bool pending() const noexcept;

    /// Respond and take the request back. On failure both the request and the
    /// undelivered reply are handed back.
    result<Request, std::pair<Request, Reply>> respond(Reply reply) &&;

    std::pair<Request, reply_obligation<Reply>> into_parts() &&;

private:
    Request request_;
    reply_obligation<Reply> obligation_;
};

template<detail::request_value Request, detail::reply_value Reply>
received_request<Request, Reply>::received_request(Request request, reply_obligation<Reply> obligation)
    : request_(std::move(request))
    , obligation_(std::move(obligation))
{}

template<detail::request_value Request, detail::reply_value Reply>
Request &received_request<Request, Reply>::request() noexcept
{
    return request_;
}

template<detail::request_value Request, detail::reply_value Reply>
const Request &received_request<Request, Reply>::request() const noexcept
{
    return request_;
}

template<detail::request_value Request, detail::reply_value Reply>
Request &received_request<Request, Reply>::operator*() noexcept
{
    return request_;
}

template<detail::request_value Request, detail::reply_value Reply>
const Request &received_request<Request, Reply>::operator*() const noexcept
{
    return request_;
}

template<detail::request_value Request, detail::reply_value Reply>
Request *received_request<Request, Reply>::operator->() noexcept
{
    return &request_;
}

template<detail::request_value Request, detail::reply_value Reply>
const Request *received_request<Request, Reply>::operator->() const noexcept
{
    return &request_;
}

template<detail::request_value Request, detail::reply_value Reply>
bool received_request<Request, Reply>::pending() const noexcept
{
    return obligation_.pending();
}

template<detail::request_value Request, detail::reply_value Reply>
result<Request, std::pair<Request, Reply>> received_request<Request, Reply>::respond(Reply reply) &&
{
    auto outcome = std::move(obligation_).respond(std::move(reply));
    if (!outcome)
    {
        return {outcome.error(), std::pair<Request, Reply>(std::move(request_), std::move(outcome.returned()))};
    }

    return std::move(request_);
}

template<detail::request_value Request, detail::reply_value Reply>
std::pair<Request, reply_obligation<Reply>> received_request<Request, Reply>::into_parts() &&
{
    return {std::move(request_), std::move(obligation_)};
}

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_RECEIVED_REQUEST_H
