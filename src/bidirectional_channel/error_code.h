#ifndef BIDIRECTIONAL_CHANNEL_ERROR_CODE_H
#define BIDIRECTIONAL_CHANNEL_ERROR_CODE_H

#include "detail/error_code.h"

namespace bidirectional_channel {
using detail::channel_error;
using detail::channel_error_category;
using detail::make_error_code;
} // namespace bidirectional_channel

#endif // BIDIRECTIONAL_CHANNEL_ERROR_CODE_H
