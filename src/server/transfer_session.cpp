#include "server/transfer_session.hpp"

#include <errno.h>

#include "common/utils.hpp"

using namespace tftp::transfer;

//========================================================
transfer_session::transfer_session(const std::string &local_address, const struct sockaddr_in &client,
                                   const std::string &filename, const std::chrono::milliseconds timeout,
                                   logging::logger_t logger) :
    _logger(std::move(logger)),
    _udp(),
    _timer(),
    _client(client),
    _client_str(utils::sockaddr_to_str(_client)),
    _filename(filename),
    _timeout(timeout),
    _state(),
    _released(false),
    _wrap_reported(false)
{
  _udp.bind(local_address, 0);
  _udp.connect(_client);
  _udp.set_non_blocking(true);
  log_trace(_logger, "Transfer of '{}' bound to local port {} [{}]", _filename, _udp.local_port(), _client_str);
}

//========================================================
transfer_session::~transfer_session() = default;

//========================================================
int transfer_session::sd() const
{
  return _udp.sd();
}

//========================================================
int transfer_session::timer_fd() const
{
  return _timer.fd();
}

//========================================================
uint16_t transfer_session::local_port() const
{
  return _udp.local_port();
}

//========================================================
bool transfer_session::is_finished() const
{
  return _released || tftp::transfer::is_finished(_state.phase);
}

//========================================================
const struct sockaddr_in &transfer_session::client() const
{
  return _client;
}

//========================================================
const std::string &transfer_session::filename() const
{
  return _filename;
}

//========================================================
tftp::transfer::phase_t transfer_session::phase() const
{
  return _state.phase;
}

//========================================================
/**
 * @brief Fetches the requested file and sends the first packet
 *
 * A missing file is answered with a single ERROR packet, otherwise block 1 goes out and the
 * retransmission timer starts.
 */
void transfer_session::start(file_cache &cache)
{
  file_cache::content_t content;
  try
  {
    content = cache.read(_filename);
  }
  catch (const file_not_found &)
  {
    log_info(_logger, "Cannot find file '{}' [{}]", _filename, _client_str);
    apply(on_file_missing(_state));
    return;
  }

  log_info(_logger, "Sending '{}' {} bytes in {} blocks [{}]", _filename, content->size(),
           block_count(content->size()), _client_str);
  apply(on_file_loaded(_state, content));
}

//========================================================
void transfer_session::handle_read()
{
  while (!_released)
  {
    std::vector<char> data;
    try
    {
      data = _udp.recv(tftp::RECV_BUFFER_SIZE);
    }
    catch (const std::exception &err)
    {
      // Usually ECONNREFUSED from an ICMP port unreachable, the retransmit timer decides the outcome
      log_debug(_logger, "Receive failed : {} [{}]", err.what(), _client_str);
      return;
    }

    if (data.empty())
    {
      return;
    }

    switch (tftp::packet_type(data))
    {
    case tftp::packet_t::ACK: {
      const auto ack = tftp::deserialise_ack_packet(data);
      if (ack)
      {
        handle_ack(ack->block_number);
      }
      break;
    }
    case tftp::packet_t::ERROR: {
      handle_client_error(data);
      break;
    }
    case tftp::packet_t::READ:
    case tftp::packet_t::WRITE:
    case tftp::packet_t::DATA: {
      log_warn(_logger, "Ignoring unexpected {} on transfer port [{}]",
               tftp::packet_type_to_string(tftp::packet_type(data)), _client_str);
      break;
    }
    case tftp::packet_t::UNKNOWN:
    default: {
      log_warn(_logger, "Unknown opcode in {} byte packet, discarding [{}]", data.size(), _client_str);
      break;
    }
    }
  }
}

//========================================================
void transfer_session::handle_timer()
{
  if (_released || !_timer.has_expired())
  {
    return;
  }

  const auto transition = on_timeout(_state);
  switch (transition.result)
  {
  case result_t::RETRANSMIT:
    log_debug(_logger, "Resending block {} after timeout. Retry {}/{} [{}]", _state.block_number,
              RETRY_COUNT - transition.state.retries_left, RETRY_COUNT, _client_str);
    break;
  case result_t::RETRIES_EXHAUSTED:
    log_warn(_logger, "Tried resending block {} {} times. Giving up [{}]", _state.block_number, RETRY_COUNT,
             _client_str);
    break;
  case result_t::LINGER_EXPIRED:
    log_debug(_logger, "No response to error packet, closing transfer [{}]", _client_str);
    break;
  default:
    break;
  }
  apply(transition);
}

//========================================================
void transfer_session::handle_ack(const uint16_t block_number)
{
  const auto transition = on_ack(_state, block_number);
  switch (transition.result)
  {
  case result_t::BLOCK_SENT:
    log_trace(_logger, "ACK for block {} ok [{}]", block_number, _client_str);
    break;
  case result_t::COMPLETED:
    log_info(_logger, "File '{}' sent ok! [{}]", _filename, _client_str);
    break;
  case result_t::DUPLICATE_ACK:
    log_debug(_logger, "ACK for previous block {}. Resending block {} [{}]", block_number, _state.block_number,
              _client_str);
    break;
  case result_t::PROTOCOL_VIOLATION:
    log_error(_logger, "Bad ACK {}, was waiting for {}. Aborting transfer [{}]", block_number, _state.block_number,
              _client_str);
    break;
  case result_t::ERROR_ACKED:
    log_info(_logger, "ACK {} for error. Stopping [{}]", block_number, _client_str);
    break;
  default:
    log_trace(_logger, "Ignoring ACK {} in state {} [{}]", block_number, phase_to_string(_state.phase),
              _client_str);
    break;
  }
  apply(transition);
}

//========================================================
void transfer_session::handle_client_error(const std::vector<char> &data)
{
  const auto error_packet = tftp::deserialise_error_packet(data);
  if (error_packet)
  {
    log_warn(_logger, "Client sent an error while in {} : {} ({}) - {} [{}]", phase_to_string(_state.phase),
             error_packet->error_code, tftp::error_code_to_string(static_cast<tftp::error_t>(error_packet->error_code)),
             error_packet->error_msg, _client_str);
  }
  else
  {
    log_warn(_logger, "Client sent a malformed error packet while in {} [{}]", phase_to_string(_state.phase),
             _client_str);
  }
  apply(on_client_error(_state));
}

//========================================================
/**
 * @brief Commits a transition and performs its side effects in order
 *
 * Send failures are left to the retransmission timer. A timer failure leaves the session without a
 * way to make progress, so it is released.
 */
void transfer_session::apply(const tftp::transfer::transition_t &transition)
{
  log_trace(_logger, "{} -> {} : {} [{}]", phase_to_string(_state.phase), phase_to_string(transition.state.phase),
            result_to_string(transition.result), _client_str);
  _state = transition.state;

  try
  {
    for (const auto effect : transition.effects)
    {
      switch (effect)
      {
      case effect_t::SEND_PACKET: {
        const ssize_t ret = _udp.send(_state.last_packet);
        if ((ret < 0) && (errno != EAGAIN) && (errno != EWOULDBLOCK))
        {
          log_error(_logger, "Send failed : {} [{}]", utils::string_error(errno), _client_str);
        }
        else if (transition.result == result_t::BLOCK_SENT)
        {
          report_block_sent();
        }
        break;
      }
      case effect_t::ARM_TIMER: {
        // After an ERROR there is nothing to resend, the timer only reaps an abandoned session
        const auto timeout = (_state.phase == phase_t::ERRORED) ? (_timeout * (RETRY_COUNT + 1)) : _timeout;
        _timer.arm_timer(timeout);
        break;
      }
      case effect_t::CANCEL_TIMER: {
        _timer.disarm_timer();
        break;
      }
      case effect_t::RELEASE: {
        if (_timer.is_armed())
        {
          _timer.disarm_timer();
        }
        _released = true;
        break;
      }
      }
    }
  }
  catch (const std::exception &err)
  {
    log_error(_logger, "Transfer aborted : {} [{}]", err.what(), _client_str);
    _state.phase = phase_t::FAILED;
    _released    = true;
  }
}

//========================================================
void transfer_session::report_block_sent()
{
  log_trace(_logger, "Sent block {} ({} bytes){} [{}]", _state.block_number, _state.last_packet.size() - 4,
            _state.terminal_block ? " final" : "", _client_str);

  if ((_state.block_number == 0) && !_wrap_reported)
  {
    log_warn(_logger, "Block number wrapped past 65535 while sending '{}' [{}]", _filename, _client_str);
    _wrap_reported = true;
  }
}
