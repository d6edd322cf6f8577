#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "server/file_cache.hpp"

struct server_config_t
{
  std::string               server_root;
  std::string               interface       = "0.0.0.0";
  uint16_t                  port            = 69;
  size_t                    max_clients     = 100;
  std::chrono::milliseconds timeout         = std::chrono::milliseconds(1000);
  size_t                    cache_max_bytes = file_cache::DEFAULT_MAX_BYTES;
  std::string               user;
  std::string               group;
  std::vector<std::string>  hooks; // opaque identifiers, passed through for external consumers
  bool                      verbose = false;
};

/**
 * @brief Parses the daemon's command line
 *
 * Prints the usage to stdout for --help and to stderr, along with the reason, for invalid input.
 *
 * @return The configuration, or nullopt if the program should exit
 */
std::optional<server_config_t> parse_command_line(int argc, char **argv);

void print_usage(const char *argv0);
