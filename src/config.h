#ifndef BIDIRECTIONAL_CHANNEL_CONFIG_H
#define BIDIRECTIONAL_CHANNEL_CONFIG_H

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

#include <spdlog/common.h>

namespace bidirectional_channel
{
    class config
    {
    public:
        [[nodiscard]] std::size_t capacity() const { return capacity_; }
        [[nodiscard]] bool unbounded() const { return capacity_ == 0; }
        [[nodiscard]] uint64_t requests() const { return requests_; }
        [[nodiscard]] uint64_t requesters() const { return requesters_; }
        [[nodiscard]] uint64_t threads() const { return threads_; }
        [[nodiscard]] spdlog::level::level_enum log_level() const { return log_level_; }

    public:
        static boost::program_options::options_description descriptions();

        /// Throws boost::program_options::error on invalid or missing options.
        static config parse(int argc, const char *const argv[]);

        static config from_command_line(int argc, char *argv[]);

    private:
        // 0 selects an unbounded queue
        std::size_t capacity_{1};
        uint64_t requests_{5};
        uint64_t requesters_{1};
        uint64_t threads_{1};
        spdlog::level::level_enum log_level_{spdlog::level::info};
    };
}


#endif //BIDIRECTIONAL_CHANNEL_CONFIG_H
