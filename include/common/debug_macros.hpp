#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#ifndef RELEASE

#define LOGGER_PATTERN "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v"

#define PRINT_FUNCTION static_cast<const char *>(__FUNCTION__)

#define log_trace(logger, ...)                                                                                         \
  logger->log(spdlog::source_loc{__FILE__, __LINE__, PRINT_FUNCTION}, spdlog::level::trace, __VA_ARGS__)
#define log_debug(logger, ...)                                                                                         \
  logger->log(spdlog::source_loc{__FILE__, __LINE__, PRINT_FUNCTION}, spdlog::level::debug, __VA_ARGS__)
#define log_info(logger, ...)                                                                                          \
  logger->log(spdlog::source_loc{__FILE__, __LINE__, PRINT_FUNCTION}, spdlog::level::info, __VA_ARGS__)
#define log_warn(logger, ...)                                                                                          \
  logger->log(spdlog::source_loc{__FILE__, __LINE__, PRINT_FUNCTION}, spdlog::level::warn, __VA_ARGS__)
#define log_error(logger, ...)                                                                                         \
  logger->log(spdlog::source_loc{__FILE__, __LINE__, PRINT_FUNCTION}, spdlog::level::err, __VA_ARGS__)
#define log_critical(logger, ...)                                                                                      \
  logger->log(spdlog::source_loc{__FILE__, __LINE__, PRINT_FUNCTION}, spdlog::level::critical, __VA_ARGS__)

#else

#define LOGGER_PATTERN "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"

#define log_trace(logger, ...) logger->trace(__VA_ARGS__)
#define log_debug(logger, ...) logger->debug(__VA_ARGS__)
#define log_info(logger, ...) logger->info(__VA_ARGS__)
#define log_warn(logger, ...) logger->warn(__VA_ARGS__)
#define log_error(logger, ...) logger->error(__VA_ARGS__)
#define log_critical(logger, ...) logger->critical(__VA_ARGS__)

#endif

namespace logging
{
  using logger_t = std::shared_ptr<spdlog::logger>;

  /* Creates and registers the daemon's stderr logger. Trace level when verbose, info otherwise. */
  logger_t create_console_logger(const std::string &name, const bool verbose);

  /* A logger that discards everything, for components constructed without one */
  logger_t null_logger();
} // namespace logging
