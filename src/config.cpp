#include "config.h"

// std
#include <cstdlib>
#include <iostream>

#include <boost/lexical_cast.hpp>

namespace po = boost::program_options;

namespace bidirectional_channel::detail {
struct PositiveType {
  PositiveType(uint64_t value)
    : value(value) {
  }

  uint64_t value;
};

void validate(boost::any& v, const std::vector<std::string>& values,
              PositiveType*, int) {
  po::validators::check_first_occurrence(v);
  auto s = po::validators::get_single_string(values);

  if (int64_t value = 0; boost::conversion::try_lexical_convert(s, value)) {
    if (value <= 0) {
      throw po::validation_error(po::validation_error::invalid_option_value);
    }

    v = PositiveType(static_cast<uint64_t>(value));
  } else {
    throw po::validation_error(po::validation_error::invalid_option_value);
  }
}

struct LogLevelType {
  LogLevelType(spdlog::level::level_enum level)
    : level(level) {
  }

  spdlog::level::level_enum level;
};

void validate(boost::any& v, const std::vector<std::string>& values,
              LogLevelType*, int) {
  po::validators::check_first_occurrence(v);
  auto s = po::validators::get_single_string(values);

  // from_str maps unknown names to off, only accept off when asked for.
  auto level = spdlog::level::from_str(s);
  if (level == spdlog::level::off && s != "off") {
    throw po::validation_error(po::validation_error::invalid_option_value);
  }

  v = LogLevelType(level);
}
}

namespace bidirectional_channel {
po::options_description config::descriptions() {
  po::options_description descriptions("Usage");

  descriptions.add_options()
      ("help,h", "print help")
      ("capacity,c", po::value<detail::PositiveType>(), "queue capacity, default 1")
      ("unbounded,u", "use an unbounded queue")
      ("requests,n", po::value<detail::PositiveType>(), "requests per requester, default 5")
      ("requesters,r", po::value<detail::PositiveType>(), "concurrent requesters, default 1")
      ("threads,t", po::value<detail::PositiveType>(), "io threads, default 1")
      ("log-level,l", po::value<detail::LogLevelType>(),
       "trace, debug, info, warning, error, critical or off");

  return descriptions;
}

config config::parse(int argc, const char* const argv[]) {
  po::variables_map vm;
  store(parse_command_line(argc, argv, descriptions()), vm);
  notify(vm);

  config cfg;

  if (vm.contains("unbounded")) {
    cfg.capacity_ = 0;
  } else if (vm.contains("capacity")) {
    cfg.capacity_ = vm["capacity"].as<detail::PositiveType>().value;
  }

  if (vm.contains("requests")) {
    cfg.requests_ = vm["requests"].as<detail::PositiveType>().value;
  }

  if (vm.contains("requesters")) {
    cfg.requesters_ = vm["requesters"].as<detail::PositiveType>().value;
  }

  if (vm.contains("threads")) {
    cfg.threads_ = vm["threads"].as<detail::PositiveType>().value;
  }

  if (vm.contains("log-level")) {
    cfg.log_level_ = vm["log-level"].as<detail::LogLevelType>().level;
  }

  return cfg;
}

config config::from_command_line(int argc, char* argv[]) {
  try {
    po::variables_map vm;
    store(parse_command_line(argc, argv, descriptions()), vm);

    if (vm.contains("help")) {
      std::cerr << descriptions() << std::endl;
      exit(0);
    }

    return parse(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << descriptions() << std::endl;
    exit(-1);
  }
}
}
