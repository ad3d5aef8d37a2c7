#ifndef BIDIRECTIONAL_CHANNEL_DETAIL_TYPE_REQUIREMENTS_H
#define BIDIRECTIONAL_CHANNEL_DETAIL_TYPE_REQUIREMENTS_H

// std
#include <concepts>
#include <type_traits>

namespace bidirectional_channel::detail {

template<typename Request>
concept request_value = std::is_object_v<Request> && !std::is_const_v<Request> && std::move_constructible<Request>;

template<typename Reply>
concept reply_value = std::is_object_v<Reply> && !std::is_const_v<Reply> && std::move_constructible<Reply>;

} // namespace bidirectional_channel::detail

#endif // BIDIRECTIONAL_CHANNEL_DETAIL_TYPE_REQUIREMENTS_H
