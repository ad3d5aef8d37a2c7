#ifndef BIDIRECTIONAL_CHANNEL_DETAIL_QUEUE_STATE_H
#define BIDIRECTIONAL_CHANNEL_DETAIL_QUEUE_STATE_H

// std
#include <atomic>

// boost
#include <boost/noncopyable.hpp>

// spdlog
#include <spdlog/spdlog.h>

// module
#include "types.h"

namespace bidirectional_channel::detail {

// Shared by every requester handle and the responder of one channel pair.
template<typename Envelope>
class queue_state : public boost::noncopyable
{
public:
    using channel_type = queue_channel_t<Envelope>;

    queue_state(const net::any_io_executor &executor, std::size_t capacity);

    ~queue_state();

    channel_type &channel() noexcept;

    void acquire_requester() noexcept;

    void release_requester();

    void close_responder();

    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] uint64_t id() const noexcept;

    [[nodiscard]] uint64_t requesters() const noexcept;

private:
    channel_type channel_;
    std::atomic<uint64_t> requesters_{0};
    const uint64_t id_;

    static inline std::atomic<uint64_t> queue_id_max_{1};
};

template<typename Envelope>
queue_state<Envelope>::queue_state(const net::any_io_executor &executor, std::size_t capacity)
    : channel_(executor, capacity)
    , id_(queue_id_max_++)
{
    SPDLOG_TRACE("queue {} created capacity: {}", id_, capacity);
}

template<typename Envelope>
queue_state<Envelope>::~queue_state()
{
    SPDLOG_TRACE("~queue {}", id_);
}

template<typename Envelope>
typename queue_state<Envelope>::channel_type &queue_state<Envelope>::channel() noexcept
{
    return channel_;
}

template<typename Envelope>
void queue_state<Envelope>::acquire_requester() noexcept
{
    requesters_.fetch_add(1, std::memory_order_relaxed);
}

template<typename Envelope>
void queue_state<Envelope>::release_requester()
{
    if (requesters_.fetch_sub(1, std::memory_order_acq_rel) == 1)
    {
        // Buffered requests stay receivable until drained.
        SPDLOG_TRACE("queue {} last requester released", id_);
        channel_.close();
    }
}

template<typename Envelope>
void queue_state<Envelope>::close_responder()
{
    SPDLOG_TRACE("queue {} responder closed", id_);
    channel_.close();

    // Drop whatever is still buffered so the pending obligations resolve as ignored.
    bool drained = false;
    while (!drained && channel_.try_receive([&drained](sys::error_code error_code, auto &&...) { drained = static_cast<bool>(error_code); }))
    {}
}

template<typename Envelope>
bool queue_state<Envelope>::is_open() const noexcept
{
    return channel_.is_open();
}

template<typename Envelope>
uint64_t queue_state<Envelope>::id() const noexcept
{
    return id_;
}

template<typename Envelope>
uint64_t queue_state<Envelope>::requesters() const noexcept
{
    return requesters_.load(std::memory_order_relaxed);
}

} // namespace bidirectional_channel::detail

#endif // BIDIRECTIONAL_CHANNEL_DETAIL_QUEUE_STATE_H
