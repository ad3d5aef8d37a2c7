#ifndef BIDIRECTIONAL_CHANNEL_RESULT_H
#define BIDIRECTIONAL_CHANNEL_RESULT_H

// std
#include <optional>

// boost
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace bidirectional_channel {
namespace sys = boost::system;

/// Outcome of a channel operation.
/// On success holds the value, on failure holds the error and, where the
/// operation hands ownership back, the returned payload.
template<typename T, typename Returned>
class result
{
public:
    result(const sys::error_code &error);

    result(const sys::error_code &error, Returned &&returned);

    result(T &&value);

    result(const T &value);

    result(const result &other) = default;

    result(result &&other) noexcept = default;

    ~result() = default;

    result &operator=(const result &other) = default;

    result &operator=(result &&other) noexcept = default;

    [[nodiscard]] sys::error_code error() const;

    /// Throws boost::system::system_error carrying error() when there is no value.
    [[nodiscard]] T &value();

    [[nodiscard]] const T &value() const;

    [[nodiscard]] bool has_returned() const noexcept;

    [[nodiscard]] Returned &returned();

    [[nodiscard]] const Returned &returned() const;

    explicit operator bool() const;

private:
    std::optional<T> value_;
    std::optional<Returned> returned_;
    sys::error_code error_;
};

template<typename T, typename Returned>
result<T, Returned>::result(const sys::error_code &error)
    : error_(error)
{}

template<typename T, typename Returned>
result<T, Returned>::result(const sys::error_code &error, Returned &&returned)
    : returned_(std::move(returned))
    , error_(error)
{}

template<typename T, typename Returned>
result<T, Returned>::result(T &&value)
    : value_(std::move(value))
{}

template<typename T, typename Returned>
result<T, Returned>::result(const T &value)
    : value_(value)
{}

template<typename T, typename Returned>
sys::error_code result<T, Returned>::error() const
{
    return error_;
}

template<typename T, typename Returned>
T &result<T, Returned>::value()
{
    if (!value_.has_value())
    {
        throw sys::system_error(error_);
    }

    return *value_;
}

template<typename T, typename Returned>
const T &result<T, Returned>::value() const
{
    if (!value_.has_value())
    {
        throw sys::system_error(error_);
    }

    return *value_;
}

template<typename T, typename Returned>
bool result<T, Returned>::has_returned() const noexcept
{
    return returned_.has_value();
}

template<typename T, typename Returned>
Returned &result<T, Returned>::returned()
{
    if (!returned_.has_value())
    {
        throw sys::system_error(error_);
    }

    return *returned_;
}

template<typename T, typename Returned>
const Returned &result<T, Returned>::returned() const
{
    if (!returned_.has_value())
    {
        throw sys::system_error(error_);
    }

    return *returned_;
}

template<typename T, typename Returned>
result<T, Returned>::operator bool() const
{
    if (error_)
    {
        return false;
    }

    return value_.has_value();
}

} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_RESULT_H
