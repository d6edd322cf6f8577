#include "server/tftp_listener.hpp"

#include <stdexcept>

#include "common/utils.hpp"

//========================================================
tftp_listener::tftp_listener(const std::string &addr, const uint16_t port, const size_t max_queued,
                             logging::logger_t logger) :
    _logger(std::move(logger)), _udp(), _max_queued(max_queued), _request_queue{}
{
  _udp.bind(addr, port);
  _udp.set_non_blocking(true);
  log_debug(_logger, "Listening on {}", _udp.local_address());
}

//========================================================
int tftp_listener::sd() const
{
  return _udp.sd();
}

//========================================================
uint16_t tftp_listener::port() const
{
  return _udp.local_port();
}

//========================================================
/**
 * @brief Drains the well-known socket
 *
 * Nothing received here is ever answered directly: read requests are queued for the server to start a
 * transfer on a fresh port, everything else is logged and discarded.
 */
void tftp_listener::handle_read()
{
  sockaddr_in client;
  auto        data = _udp.recv_from(client, tftp::RECV_BUFFER_SIZE);

  while (!data.empty())
  {
    handle_datagram(data, client);
    data = _udp.recv_from(client, tftp::RECV_BUFFER_SIZE);
  }
}

//========================================================
void tftp_listener::handle_datagram(const std::vector<char> &data, const sockaddr_in &client)
{
  const auto type = tftp::packet_type(data);
  switch (type)
  {
  case tftp::packet_t::READ: {
    handle_read_request(data, client);
    break;
  }
  case tftp::packet_t::WRITE: {
    log_warn(_logger, "Write requests are not supported, dropping WRQ from {}", client);
    break;
  }
  case tftp::packet_t::DATA:
  case tftp::packet_t::ACK:
  case tftp::packet_t::ERROR: {
    log_info(_logger, "Stray {} on the listening port from {}, ignoring", tftp::packet_type_to_string(type), client);
    break;
  }
  case tftp::packet_t::UNKNOWN:
  default: {
    log_warn(_logger, "Unknown opcode in {} byte packet from {}, discarding", data.size(), client);
    break;
  }
  }
}

//========================================================
void tftp_listener::handle_read_request(const std::vector<char> &data, const sockaddr_in &client)
{
  const auto request = tftp::deserialise_rw_packet(data);
  if (!request)
  {
    log_error(_logger, "Failed to parse request from {}", client);
    return;
  }

  const auto mode = tftp::string_to_mode_t(request->mode);
  if (!mode || (mode.value() != tftp::mode_t::OCTET))
  {
    log_warn(_logger, "Mode '{}' is not implemented, dropping request for '{}' from {}", request->mode,
             request->filename, client);
    return;
  }

  if (is_queued(request->filename, client))
  {
    log_debug(_logger, "Request for '{}' from {} is already queued, ignoring retransmission", request->filename,
              client);
    return;
  }

  if (_request_queue.size() >= _max_queued)
  {
    log_warn(_logger, "Request queue full ({} waiting), dropping request for '{}' from {}", _request_queue.size(),
             request->filename, client);
    return;
  }

  log_trace(_logger, "Enqueued request for '{}' from {}", request->filename, client);
  _request_queue.emplace_back(request->filename, client);
}

//========================================================
bool tftp_listener::is_queued(const std::string &filename, const sockaddr_in &client) const
{
  for (const auto &r : _request_queue)
  {
    if ((r.client.sin_addr.s_addr == client.sin_addr.s_addr) && (r.client.sin_port == client.sin_port) &&
        (r.filename == filename))
    {
      return true;
    }
  }
  return false;
}

//========================================================
bool tftp_listener::requests_pending() const
{
  return !_request_queue.empty();
}

//========================================================
size_t tftp_listener::requests_queued() const
{
  return _request_queue.size();
}

//========================================================
tftp_listener::request_t tftp_listener::get_request()
{
  if (_request_queue.empty())
  {
    throw std::out_of_range("Request queue is empty");
  }
  auto ret = _request_queue.front();
  _request_queue.pop_front();
  return ret;
}

//========================================================
/**
 * @brief Discards requests that waited longer than max_wait for a transfer slot
 *
 * A client gives up long before then, so serving the request would only send DATA to a dead port.
 *
 * @return the number of requests discarded
 */
size_t tftp_listener::drop_stale(const std::chrono::milliseconds max_wait)
{
  const auto now     = std::chrono::steady_clock::now();
  size_t     dropped = 0;

  while (!_request_queue.empty() && ((now - _request_queue.front().received) >= max_wait))
  {
    const auto &r = _request_queue.front();
    log_info(_logger, "Request for '{}' from {} waited too long for a free slot, dropping", r.filename, r.client);
    _request_queue.pop_front();
    ++dropped;
  }
  return dropped;
}
