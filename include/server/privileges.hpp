#pragma once

#include <string>

#include "common/debug_macros.hpp"

namespace privileges
{
  /**
   * @brief Permanently switches the process to an unprivileged user and / or group
   *
   * Must run after privileged ports are bound. Either name may be empty to leave that id unchanged.
   * When a user is given without a group, the user's primary group is used.
   *
   * @throws std::runtime_error if a name cannot be resolved or an id cannot be set
   */
  void drop_privileges(const std::string &user, const std::string &group, logging::logger_t logger);
} // namespace privileges
