#pragma once

#include <arpa/inet.h>
#include <chrono>
#include <deque>
#include <string>
#include <vector>

#include "common/debug_macros.hpp"
#include "common/tftp.hpp"
#include "common/udp_connection.hpp"

/**
 * Owns the well-known port. Queues valid octet read requests and drops everything else.
 * The queue holds at most max_queued requests and a client retransmitting the same request is queued once.
 */
class tftp_listener
{
public:
  tftp_listener(const std::string &addr, const uint16_t port, const size_t max_queued, logging::logger_t logger);
  tftp_listener(const tftp_listener &) = delete;
  tftp_listener(tftp_listener &&)      = delete;
  tftp_listener &operator=(const tftp_listener &) = delete;
  tftp_listener &operator=(tftp_listener &&) = delete;

  struct request_t
  {
    request_t(const std::string &f, const sockaddr_in cl) :
        filename(f), client(cl), received(std::chrono::steady_clock::now()){};
    std::string                           filename;
    sockaddr_in                           client;
    std::chrono::steady_clock::time_point received;
  };

  int       sd() const;
  uint16_t  port() const;
  void      handle_read();
  bool      requests_pending() const;
  size_t    requests_queued() const;
  request_t get_request();
  size_t    drop_stale(const std::chrono::milliseconds max_wait);

private:
  logging::logger_t     _logger;
  udp_connection        _udp;
  const size_t          _max_queued;
  std::deque<request_t> _request_queue;

  void handle_datagram(const std::vector<char> &data, const sockaddr_in &client);
  void handle_read_request(const std::vector<char> &data, const sockaddr_in &client);
  bool is_queued(const std::string &filename, const sockaddr_in &client) const;
};
