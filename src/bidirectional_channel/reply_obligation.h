#ifndef BIDIRECTIONAL_CHANNEL_REPLY_OBLIGATION_H
#define BIDIRECTIONAL_CHANNEL_REPLY_OBLIGATION_H

// std
#include <memory>
#include <utility>
#include <variant>

// boost
#include <boost/system/system_error.hpp>

// spdlog
#include <spdlog/spdlog.h>

// module
#include "detail/error_code.h"
#include "detail/reply_slot.h"
#include "detail/type_requirements.h"
#include "result.h"

namespace bidirectional_channel {

namespace detail {
struct reply_slot_access;
}

/// A reply still owed to a waiting requester.
///
/// Move-only. Consumed by respond() whatever the outcome. Destroying an
/// obligation that was never responded to resolves the requester with
/// channel_error::ignored.
template<detail::reply_value Reply>
class reply_obligation
{
public:
    reply_obligation(const reply_obligation &) = delete;

    reply_obligation &operator=(const reply_obligation &) = delete;

    reply_obligation(reply_obligation &&other) noexcept;

    reply_obligation &operator=(reply_obligation &&other) noexcept;

    ~reply_obligation();

    /// Deliver the reply. Fails with channel_error::requester_gone and hands the
    /// reply back when nobody waits for it anymore.
    /// Throws boost::system::system_error(channel_error::already_responded) when
    /// the obligation was already consumed.
    result<std::monostate, Reply> respond(Reply reply) &&;

    result<std::monostate, Reply> discharge(Reply reply) &&;

    [[nodiscard]] bool pending() const noexcept;

private:
    friend struct detail::reply_slot_access;

    explicit reply_obligation(std::shared_ptr<detail::reply_state<Reply>> state);

    void release() noexcept;

    std::shared_ptr<detail::reply_state<Reply>> state_;
};

template<detail::reply_value Reply>
reply_obligation<Reply>::reply_obligation(std::shared_ptr<detail::reply_state<Reply>> state)
    : state_(std::move(state))
{}

template<detail::reply_value Reply>
reply_obligation<Reply>::reply_obligation(reply_obligation &&other) noexcept
    : state_(std::move(other.state_))
{}

template<detail::reply_value Reply>
reply_obligation<Reply> &reply_obligation<Reply>::operator=(reply_obligation &&other) noexcept
{
    if (this != &other)
    {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

template<detail::reply_value Reply>
reply_obligation<Reply>::~reply_obligation()
{
    release();
}

template<detail::reply_value Reply>
result<std::monostate, Reply> reply_obligation<Reply>::respond(Reply reply) &&
{
    if (state_ == nullptr)
    {
        throw sys::system_error(detail::channel_error::already_responded);
    }

    auto state = std::move(state_);
    if (!state->try_deliver(reply))
    {
        return {detail::channel_error::requester_gone, std::move(reply)};
    }

    return std::monostate{};
}

template<detail::reply_value Reply>
result<std::monostate, Reply> reply_obligation<Reply>::discharge(Reply reply) &&
{
    return std::move(*this).respond(std::move(reply));
}

template<detail::reply_value Reply>
bool reply_obligation<Reply>::pending() const noexcept
{
    return state_ != nullptr;
}

template<detail::reply_value Reply>
void reply_obligation<Reply>::release() noexcept
{
    if (state_ != nullptr)
    {
        state_->abandon_sender();
        state_.reset();
    }
}

namespace detail {

struct reply_slot_access
{
    template<reply_value Reply>
    static std::pair<reply_obligation<Reply>, reply_receiver<Reply>> make(const net::any_io_executor &executor)
    {
        auto state = std::make_shared<reply_state<Reply>>(executor);
        return {reply_obligation<Reply>(state), reply_receiver<Reply>(state)};
    }
};

template<reply_value Reply>
std::pair<reply_obligation<Reply>, reply_receiver<Reply>> make_reply_slot(const net::any_io_executor &executor)
{
    return reply_slot_access::make<Reply>(executor);
}

} // namespace detail

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_REPLY_OBLIGATION_H
