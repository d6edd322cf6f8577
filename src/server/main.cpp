#include <signal.h>

#include <fmt/core.h>

#include "common/debug_macros.hpp"
#include "server/privileges.hpp"
#include "server/server_config.hpp"
#include "server/tftp_server.hpp"

static tftp_server *_pserver = nullptr;

void sig_handler(int signum);
void setup_signal_handlers();

//==========================================================
int main(int argc, char **argv)
{
  const auto config = parse_command_line(argc, argv);
  if (!config)
  {
    return 1;
  }

  logging::logger_t logger;
  try
  {
    logger = logging::create_console_logger("console", config->verbose);
  }
  catch (const std::exception &e)
  {
    fmt::print(stderr, "Failed to setup logger : {}\n", e.what());
    return 1;
  }
  log_debug(logger, "Debug prints on");
  for (const auto &hook : config->hooks)
  {
    log_info(logger, "Hook '{}' registered", hook);
  }

  setup_signal_handlers();

  try
  {
    tftp_server server(config.value(), logger);
    privileges::drop_privileges(config->user, config->group, logger);
    _pserver = &server;

    log_trace(logger, "Starting server");
    server.start();
    _pserver = nullptr;
  }
  catch (const std::exception &e)
  {
    _pserver = nullptr;
    log_error(logger, "Server failed : {}", e.what());
    return 1;
  }

  log_trace(logger, "Exit now");
  return 0;
}

//==========================================================
void sig_handler(int signum)
{
  (void)signum;
  if (_pserver)
  {
    _pserver->stop();
  }
}

//==========================================================
void setup_signal_handlers()
{
  struct sigaction new_action;
  sigemptyset(&new_action.sa_mask);
  new_action.sa_flags   = 0;
  new_action.sa_handler = sig_handler;

  sigaction(SIGINT, &new_action, NULL);
  sigaction(SIGHUP, &new_action, NULL);
  sigaction(SIGTERM, &new_action, NULL);
}
