#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <string>

#include "common/debug_macros.hpp"
#include "server/file_cache.hpp"
#include "server/server_config.hpp"
#include "server/tftp_listener.hpp"
#include "server/transfer_session.hpp"

class tftp_server
{
public:
  tftp_server(const server_config_t &config, logging::logger_t logger);
  ~tftp_server();
  tftp_server(const tftp_server &) = delete;
  tftp_server(tftp_server &&)      = delete;
  tftp_server &operator=(const tftp_server &) = delete;
  tftp_server &operator=(tftp_server &&) = delete;

  void start();
  void stop();

  uint16_t    port() const;
  file_cache &cache();

private:
  /* What an epoll event refers to, stored in epoll_event::data.ptr */
  struct epoll_tag_t
  {
    enum class source_t
    {
      LISTENER,
      SESSION_SOCKET,
      SESSION_TIMER
    };
    source_t          source;
    transfer_session *session;
  };

  struct session_entry_t
  {
    explicit session_entry_t(std::unique_ptr<transfer_session> s) :
        session(std::move(s)),
        socket_tag{epoll_tag_t::source_t::SESSION_SOCKET, session.get()},
        timer_tag{epoll_tag_t::source_t::SESSION_TIMER, session.get()} {};
    std::unique_ptr<transfer_session> session;
    epoll_tag_t                       socket_tag;
    epoll_tag_t                       timer_tag;
  };

  logging::logger_t          _logger;
  const server_config_t      _config;
  int                        _epoll_fd;
  std::atomic_bool           _exit_requested;
  tftp_listener              _listener;
  file_cache                 _cache;
  std::list<session_entry_t> _sessions;
  epoll_tag_t                _listener_tag;

  void accept_requests();
  void reap_sessions();
  void dispatch(const epoll_tag_t &tag);
  void epoll_ctl_add(const int fd, const uint32_t events, void *data);
  void epoll_ctl_del(const int fd);
};
