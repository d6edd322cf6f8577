#include "common/timer.hpp"

#include <errno.h>
#include <stdint.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <stdexcept>

#include "common/utils.hpp"

//========================================================
timer::timer() :
    _fd(-1), _armed(false)
{
  _fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
  if (_fd < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
timer::~timer()
{
  if (_fd >= 0)
  {
    close(_fd);
  }
}

//========================================================
int timer::fd() const
{
  return _fd;
}

//========================================================
bool timer::is_armed() const
{
  return _armed;
}

//========================================================
void timer::arm_timer(const std::chrono::milliseconds timeout)
{
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  const auto nanos   = std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - seconds);

  struct itimerspec new_value;
  new_value.it_value.tv_sec     = seconds.count();
  new_value.it_value.tv_nsec    = nanos.count();
  new_value.it_interval.tv_sec  = 0;
  new_value.it_interval.tv_nsec = 0;

  // An all-zero it_value would disarm the timer instead
  if ((new_value.it_value.tv_sec <= 0) && (new_value.it_value.tv_nsec <= 0))
  {
    new_value.it_value.tv_sec  = 0;
    new_value.it_value.tv_nsec = 1;
  }

  if (timerfd_settime(_fd, 0, &new_value, NULL) == -1)
  {
    throw std::runtime_error("Failed to arm timer : " + utils::string_error(errno));
  }
  _armed = true;
}

//========================================================
void timer::disarm_timer()
{
  struct itimerspec new_value;
  new_value.it_value.tv_sec     = 0;
  new_value.it_value.tv_nsec    = 0;
  new_value.it_interval.tv_sec  = 0;
  new_value.it_interval.tv_nsec = 0;
  if (timerfd_settime(_fd, 0, &new_value, NULL) == -1)
  {
    throw std::runtime_error("Failed to disarm timer : " + utils::string_error(errno));
  }
  _armed = false;
}

//========================================================
bool timer::has_expired()
{
  uint64_t      exp = 0;
  const ssize_t ret = read(_fd, &exp, sizeof(uint64_t));
  if ((ret > 0) && (exp > 0))
  {
    _armed = false;
    return true;
  }
  return false;
}
