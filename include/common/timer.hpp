#pragma once

#include <chrono>

/* One-shot CLOCK_MONOTONIC timerfd. Arming always replaces any pending deadline. */
class timer
{
public:
  timer();
  timer(const timer &)            = delete;
  timer(timer &&)                 = delete;
  timer &operator=(const timer &) = delete;
  timer &operator=(timer &&)      = delete;
  ~timer();

  void arm_timer(const std::chrono::milliseconds timeout);
  void disarm_timer();
  bool is_armed() const;
  bool has_expired();
  int  fd() const;

private:
  int  _fd;
  bool _armed;
};
