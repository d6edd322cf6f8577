#pragma once

#include <arpa/inet.h>

#include <chrono>
#include <string>

#include "common/debug_macros.hpp"
#include "common/timer.hpp"
#include "common/udp_connection.hpp"
#include "server/file_cache.hpp"
#include "server/transfer_state_machine.hpp"

/**
 * @brief One read transfer to one client
 *
 * Owns a UDP socket bound to an ephemeral port and connected to the client, so the kernel only delivers
 * datagrams from the client's transfer ID, and a timerfd for retransmissions. The protocol decisions are
 * made by tftp::transfer, this class performs the resulting sends and timer changes.
 */
class transfer_session
{
public:
  transfer_session(const std::string &local_address, const struct sockaddr_in &client, const std::string &filename,
                   const std::chrono::milliseconds timeout, logging::logger_t logger);
  ~transfer_session();
  transfer_session()                                    = delete;
  transfer_session(const transfer_session &)            = delete;
  transfer_session(transfer_session &&)                 = delete;
  transfer_session &operator=(const transfer_session &) = delete;
  transfer_session &operator=(transfer_session &&)      = delete;

  void start(file_cache &cache);
  void handle_read();
  void handle_timer();

  bool                    is_finished() const;
  int                     sd() const;
  int                     timer_fd() const;
  uint16_t                local_port() const;
  const struct sockaddr_in &client() const;
  const std::string       &filename() const;
  tftp::transfer::phase_t phase() const;

private:
  logging::logger_t               _logger;
  udp_connection                  _udp;
  timer                           _timer;
  const struct sockaddr_in        _client;
  const std::string               _client_str;
  const std::string               _filename;
  const std::chrono::milliseconds _timeout;
  tftp::transfer::state_t         _state;
  bool                            _released;
  bool                            _wrap_reported;

  void handle_ack(const uint16_t block_number);
  void handle_client_error(const std::vector<char> &data);
  void apply(const tftp::transfer::transition_t &transition);
  void report_block_sent();
};
