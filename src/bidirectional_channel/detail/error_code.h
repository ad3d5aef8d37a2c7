#ifndef BIDIRECTIONAL_CHANNEL_DETAIL_ERROR_CODE_H
#define BIDIRECTIONAL_CHANNEL_DETAIL_ERROR_CODE_H

#include <boost/system/error_code.hpp>

namespace bidirectional_channel::detail {
namespace sys = boost::system;

enum class channel_error
{
    success = 0,
    closed = 1,
    ignored = 2,
    requester_gone = 3,
    already_responded = 4
};

// ReSharper disable once CppPolymorphicClassWithNonVirtualPublicDestructor
class channel_error_category_impl : public sys::error_category
{
public:
    const char *name() const noexcept final
    {
        return "bidirectional channel";
    }

    std::string message(int code) const final
    {
        switch (static_cast<channel_error>(code))
        {
        case channel_error::success:
            return "success";
        case channel_error::closed:
            return "responder closed before the request was sent";
        case channel_error::ignored:
            return "request dropped without a response";
        case channel_error::requester_gone:
            return "requester stopped waiting for the response";
        case channel_error::already_responded:
            return "request already responded";
        default:
            return "unknown";
        }
    }

    sys::error_condition default_error_condition(int code) const noexcept final
    {
        switch (static_cast<channel_error>(code))
        {
        case channel_error::success:
            return {};
        default:
            return {code, *this};
        }
    }

    bool failed(int ev) const noexcept override
    {
        return static_cast<channel_error>(ev) != channel_error::success;
    }
};

extern inline const channel_error_category_impl &channel_error_category()
{
    static channel_error_category_impl instance;
    return instance;
}

inline sys::error_code make_error_code(channel_error error)
{
    return {static_cast<int>(error), channel_error_category()};
}

} // namespace bidirectional_channel::detail

template<>
struct boost::system::is_error_code_enum<bidirectional_channel::detail::channel_error> : std::true_type
{};

#endif // BIDIRECTIONAL_CHANNEL_DETAIL_ERROR_CODE_H
