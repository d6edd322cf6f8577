#include "server/privileges.hpp"

#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <stdexcept>

#include "common/utils.hpp"

//==========================================================
void privileges::drop_privileges(const std::string &user, const std::string &group, logging::logger_t logger)
{
  if (user.empty() && group.empty())
  {
    log_debug(logger, "No user or group given, keeping uid {} gid {}", getuid(), getgid());
    return;
  }

  uid_t uid = getuid();
  gid_t gid = getgid();

  if (!user.empty())
  {
    errno = 0;
    const struct passwd *pwd = getpwnam(user.c_str());
    if (pwd == nullptr)
    {
      log_error(logger, "Unknown user '{}' : {}", user, errno ? utils::string_error(errno) : "no such entry");
      throw std::runtime_error("Unknown user " + user);
    }
    uid = pwd->pw_uid;
    gid = pwd->pw_gid;
  }

  if (!group.empty())
  {
    errno = 0;
    const struct group *grp = getgrnam(group.c_str());
    if (grp == nullptr)
    {
      log_error(logger, "Unknown group '{}' : {}", group, errno ? utils::string_error(errno) : "no such entry");
      throw std::runtime_error("Unknown group " + group);
    }
    gid = grp->gr_gid;
  }

  // Supplementary groups first, it needs the privileges being dropped
  if ((geteuid() == 0) && (setgroups(1, &gid) < 0))
  {
    log_error(logger, "setgroups({}) failed : {}", gid, utils::string_error(errno));
    throw std::runtime_error("Failed to set supplementary groups");
  }

  if (setgid(gid) < 0)
  {
    log_error(logger, "setgid({}) failed : {}", gid, utils::string_error(errno));
    throw std::runtime_error("Failed to set group id");
  }

  if (!user.empty() && (setuid(uid) < 0))
  {
    log_error(logger, "setuid({}) failed : {}", uid, utils::string_error(errno));
    throw std::runtime_error("Failed to set user id");
  }

  if ((uid != 0) && (setuid(0) == 0))
  {
    log_critical(logger, "Regained root after dropping privileges");
    throw std::runtime_error("Privileges were not dropped");
  }

  log_info(logger, "Running as uid {} gid {}", getuid(), getgid());
}
