#include "server/tftp_server.hpp"

#include <errno.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <filesystem>
#include <stdexcept>

#include "common/utils.hpp"

namespace
{
  const int POLL_INTERVAL_MS = 100;
  const int MAX_EVENTS       = 32;
}; // namespace

//========================================================
tftp_server::tftp_server(const server_config_t &config, logging::logger_t logger) :
    _logger(std::move(logger)),
    _config(config),
    _epoll_fd(-1),
    _exit_requested(false),
    _listener(config.interface, config.port, config.max_clients, _logger),
    _cache(config.server_root, _logger, config.cache_max_bytes),
    _sessions{},
    _listener_tag{epoll_tag_t::source_t::LISTENER, nullptr}
{
  std::error_code err;
  if (!std::filesystem::is_directory(config.server_root, err))
  {
    log_error(_logger, "Server root '{}' is not a directory", config.server_root);
    throw std::runtime_error("Invalid server root");
  }

  _epoll_fd = epoll_create1(EPOLL_CLOEXEC);
  if (_epoll_fd < 0)
  {
    log_error(_logger, "Failed to create epoll : {}", utils::string_error(errno));
    throw std::runtime_error("Failed to create epoll");
  }
}

//========================================================
void tftp_server::stop()
{
  _exit_requested = true;
}

//========================================================
tftp_server::~tftp_server()
{
  _sessions.clear();
  if (_epoll_fd >= 0)
  {
    close(_epoll_fd);
  }
}

//========================================================
uint16_t tftp_server::port() const
{
  return _listener.port();
}

//========================================================
file_cache &tftp_server::cache()
{
  return _cache;
}

//========================================================
/**
 * @brief Runs the reactor until stop() is called
 *
 * One thread services the listening socket and every transfer's socket and timer. Transfers only ever
 * see events on their own descriptors.
 */
void tftp_server::start()
{
  epoll_ctl_add(_listener.sd(), EPOLLIN, &_listener_tag);
  log_info(_logger, "Serving '{}' on {}:{}", _config.server_root, _config.interface, _listener.port());

  epoll_event events[MAX_EVENTS];

  while (!_exit_requested)
  {
    const int num_events = epoll_wait(_epoll_fd, events, MAX_EVENTS, POLL_INTERVAL_MS);
    if (num_events < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      log_error(_logger, "epoll error : {}", utils::string_error(errno));
      throw std::runtime_error("epoll error");
    }

    for (int i = 0; i < num_events; ++i)
    {
      dispatch(*static_cast<const epoll_tag_t *>(events[i].data.ptr));
    }

    reap_sessions();
    accept_requests();
  }

  log_debug(_logger, "Server stopped with {} transfers in progress", _sessions.size());
  _sessions.clear();
  epoll_ctl_del(_listener.sd());
}

//========================================================
void tftp_server::dispatch(const epoll_tag_t &tag)
{
  switch (tag.source)
  {
  case epoll_tag_t::source_t::LISTENER: {
    try
    {
      _listener.handle_read();
    }
    catch (const std::exception &err)
    {
      log_error(_logger, "Failed to read from the listening socket : {}", err.what());
    }
    break;
  }
  case epoll_tag_t::source_t::SESSION_SOCKET: {
    tag.session->handle_read();
    break;
  }
  case epoll_tag_t::source_t::SESSION_TIMER: {
    tag.session->handle_timer();
    break;
  }
  }
}

//========================================================
void tftp_server::accept_requests()
{
  _listener.drop_stale(_config.timeout * (tftp::transfer::RETRY_COUNT + 1));

  while (_listener.requests_pending() && (_sessions.size() < _config.max_clients))
  {
    const auto request = _listener.get_request();
    log_trace(_logger, "Accepting new transfer of '{}' for client {}", request.filename, request.client);

    try
    {
      auto session = std::make_unique<transfer_session>(_config.interface, request.client, request.filename,
                                                        _config.timeout, _logger);
      _sessions.emplace_back(std::move(session));
    }
    catch (const std::exception &err)
    {
      log_error(_logger, "Failed to create transfer for {} : {}", request.client, err.what());
      continue;
    }

    auto &entry = _sessions.back();
    try
    {
      epoll_ctl_add(entry.session->sd(), EPOLLIN, &entry.socket_tag);
      epoll_ctl_add(entry.session->timer_fd(), EPOLLIN, &entry.timer_tag);
    }
    catch (const std::exception &err)
    {
      // Closing the descriptors takes them out of the epoll set
      log_error(_logger, "Failed to register transfer for {} : {}", request.client, err.what());
      _sessions.pop_back();
      continue;
    }

    try
    {
      entry.session->start(_cache);
    }
    catch (const std::exception &err)
    {
      log_error(_logger, "Failed to start transfer of '{}' for {} : {}", request.filename, request.client,
                err.what());
      _sessions.pop_back();
    }
  }

  if (_listener.requests_pending())
  {
    log_trace(_logger, "{} requests waiting for a free transfer slot", _listener.requests_queued());
  }
}

//========================================================
void tftp_server::reap_sessions()
{
  for (auto iter = _sessions.begin(); iter != _sessions.end();)
  {
    if (!iter->session->is_finished())
    {
      ++iter;
      continue;
    }

    log_trace(_logger, "Closing transfer of '{}' for {} in state {}", iter->session->filename(),
              iter->session->client(), tftp::transfer::phase_to_string(iter->session->phase()));
    try
    {
      epoll_ctl_del(iter->session->sd());
      epoll_ctl_del(iter->session->timer_fd());
    }
    catch (const std::exception &err)
    {
      log_warn(_logger, "Failed to unregister transfer for {} : {}", iter->session->client(), err.what());
    }
    iter = _sessions.erase(iter);
  }
}

//========================================================
void tftp_server::epoll_ctl_add(const int fd, const uint32_t events, void *data)
{
  struct epoll_event e = {0, {0}};
  e.events             = events;
  e.data.ptr           = data;

  if (epoll_ctl(_epoll_fd, EPOLL_CTL_ADD, fd, &e) < 0)
  {
    log_error(_logger, "epoll add failed : {}", utils::string_error(errno));
    throw std::runtime_error("epoll add failed");
  }
}

//========================================================
void tftp_server::epoll_ctl_del(const int fd)
{
  if (epoll_ctl(_epoll_fd, EPOLL_CTL_DEL, fd, NULL) < 0)
  {
    log_error(_logger, "epoll del failed : {}", utils::string_error(errno));
    throw std::runtime_error("epoll del failed");
  }
}
