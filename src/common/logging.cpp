#include "common/debug_macros.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

//========================================================
logging::logger_t logging::create_console_logger(const std::string &name, const bool verbose)
{
  auto logger = spdlog::get(name);
  if (!logger)
  {
    logger = spdlog::stderr_color_mt(name);
  }

  logger->set_pattern(LOGGER_PATTERN);
  if (verbose)
  {
    logger->set_level(spdlog::level::trace);
  }
  else
  {
    logger->set_level(spdlog::level::info);
  }
  return logger;
}

//========================================================
logging::logger_t logging::null_logger()
{
  return std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
}
