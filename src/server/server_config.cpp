#include "server/server_config.hpp"

#include <getopt.h>

#include <fmt/core.h>

#include <limits>
#include <stdexcept>

#include "common/utils.hpp"

namespace
{
  const char USAGE[] = R"({}: [OPTIONS]
  -r --root DIR          : (Required) Directory from which to serve files
  -i --interface ADDR    : Local IPv4 address to bind to (default 0.0.0.0)
  -p --port PORT         : UDP port to listen on (default 69)
  -u --user USER         : User to switch to once the port is bound
  -g --group GROUP       : Group to switch to once the port is bound
  -c --max-clients N     : Maximum concurrent transfers (default 100)
  -t --timeout MS        : Retransmission timeout in milliseconds (default 1000)
  -m --cache-size BYTES  : File cache budget in bytes (default 67108864)
  -k --hook NAME         : Hook identifier, may be repeated
  -v --verbose           : Turn on debug and trace prints
  -h --help              : Print this help
)";

  template <typename T> std::optional<T> parse_number(const char *value, const T min, const T max)
  {
    try
    {
      size_t             pos    = 0;
      const std::string  str(value);
      const unsigned long long parsed = std::stoull(str, &pos);
      if ((pos != str.size()) || (str.find('-') != std::string::npos) || (parsed < min) || (parsed > max))
      {
        return {};
      }
      return static_cast<T>(parsed);
    }
    catch (const std::exception &)
    {
      return {};
    }
  }
}; // namespace

//==========================================================
void print_usage(const char *argv0)
{
  fmt::print(stderr, fmt::runtime(USAGE), argv0);
}

//==========================================================
std::optional<server_config_t> parse_command_line(int argc, char **argv)
{
  static struct option long_options[] = {{"root", required_argument, 0, 'r'},
                                         {"interface", required_argument, 0, 'i'},
                                         {"port", required_argument, 0, 'p'},
                                         {"user", required_argument, 0, 'u'},
                                         {"group", required_argument, 0, 'g'},
                                         {"max-clients", required_argument, 0, 'c'},
                                         {"timeout", required_argument, 0, 't'},
                                         {"cache-size", required_argument, 0, 'm'},
                                         {"hook", required_argument, 0, 'k'},
                                         {"verbose", no_argument, 0, 'v'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  server_config_t config;

  // Full rescan, parse_command_line may run more than once per process
  optind = 0;
  opterr = 0;

  while (true)
  {
    int option_index = 0;

    int c = getopt_long(argc, argv, "r:i:p:u:g:c:t:m:k:vh", long_options, &option_index);

    if (c == -1)
      break;

    switch (c)
    {
    case 'r': {
      config.server_root = optarg;
      break;
    }
    case 'i': {
      if (!utils::to_sockaddr_in(optarg, 0))
      {
        fmt::print(stderr, "Invalid interface address '{}'\n", optarg);
        print_usage(argv[0]);
        return std::nullopt;
      }
      config.interface = optarg;
      break;
    }
    case 'p': {
      const auto port = parse_number<uint16_t>(optarg, 0, std::numeric_limits<uint16_t>::max());
      if (!port)
      {
        fmt::print(stderr, "Invalid port number '{}'\n", optarg);
        print_usage(argv[0]);
        return std::nullopt;
      }
      config.port = port.value();
      break;
    }
    case 'u': {
      config.user = optarg;
      break;
    }
    case 'g': {
      config.group = optarg;
      break;
    }
    case 'c': {
      const auto max_clients = parse_number<size_t>(optarg, 1, std::numeric_limits<size_t>::max());
      if (!max_clients)
      {
        fmt::print(stderr, "Invalid maximum client count '{}'\n", optarg);
        print_usage(argv[0]);
        return std::nullopt;
      }
      config.max_clients = max_clients.value();
      break;
    }
    case 't': {
      const auto timeout = parse_number<uint32_t>(optarg, 1, std::numeric_limits<uint32_t>::max());
      if (!timeout)
      {
        fmt::print(stderr, "Invalid timeout '{}'\n", optarg);
        print_usage(argv[0]);
        return std::nullopt;
      }
      config.timeout = std::chrono::milliseconds(timeout.value());
      break;
    }
    case 'm': {
      const auto cache_size = parse_number<size_t>(optarg, 0, std::numeric_limits<size_t>::max());
      if (!cache_size)
      {
        fmt::print(stderr, "Invalid cache size '{}'\n", optarg);
        print_usage(argv[0]);
        return std::nullopt;
      }
      config.cache_max_bytes = cache_size.value();
      break;
    }
    case 'k': {
      config.hooks.emplace_back(optarg);
      break;
    }
    case 'v': {
      config.verbose = true;
      break;
    }
    case 'h': {
      fmt::print(fmt::runtime(USAGE), argv[0]);
      return std::nullopt;
    }
    case '?':
    default: {
      fmt::print(stderr, "Unknown or incomplete option\n");
      print_usage(argv[0]);
      return std::nullopt;
    }
    }
  }

  if (optind < argc)
  {
    fmt::print(stderr, "Unexpected argument '{}'\n", argv[optind]);
    print_usage(argv[0]);
    return std::nullopt;
  }

  if (config.server_root.empty())
  {
    fmt::print(stderr, "A server root is required\n");
    print_usage(argv[0]);
    return std::nullopt;
  }

  return config;
}
