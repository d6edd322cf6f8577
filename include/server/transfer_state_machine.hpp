#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/tftp.hpp"

/**
 * Read transfer state machine.
 *
 * Every event handler is a pure function of the current state and the event. It returns the next state,
 * the side effects the owner must perform (in order) and a result describing what happened. Nothing in
 * here touches sockets or timers, the owning transfer_session executes the effects.
 */
namespace tftp::transfer
{

  static const uint8_t RETRY_COUNT = 5;
  static const size_t  BLOCK_SIZE  = DATA_PKT_DATA_MAX_SIZE;

  extern const char NOT_FOUND_MSG[];

  enum class phase_t
  {
    START,
    AWAIT_ACK,
    DONE,
    FAILED,
    ERRORED,
    CLOSED
  };

  enum class effect_t
  {
    SEND_PACKET, // transmit state.last_packet
    ARM_TIMER,
    CANCEL_TIMER,
    RELEASE
  };

  enum class result_t
  {
    BLOCK_SENT,
    DUPLICATE_ACK,
    RETRANSMIT,
    COMPLETED,
    RETRIES_EXHAUSTED,
    PROTOCOL_VIOLATION,
    NOT_FOUND,
    ERROR_ACKED,
    CLIENT_ERROR,
    LINGER_EXPIRED,
    IGNORED
  };

  struct state_t
  {
    phase_t                                  phase = phase_t::START;
    std::shared_ptr<const std::vector<char>> content;
    uint64_t                                 block_index  = 0; // blocks started so far, not wrapped
    uint16_t                                 block_number = 0; // block number on the wire
    std::vector<char>                        last_packet;
    uint8_t                                  retries_left   = RETRY_COUNT;
    bool                                     terminal_block = false;
  };

  struct transition_t
  {
    state_t               state;
    std::vector<effect_t> effects;
    result_t              result;
  };

  transition_t on_file_loaded(const state_t &state, std::shared_ptr<const std::vector<char>> content);
  transition_t on_file_missing(const state_t &state);
  transition_t on_ack(const state_t &state, const uint16_t block_number);
  transition_t on_client_error(const state_t &state);
  transition_t on_timeout(const state_t &state);

  /* Number of DATA packets needed for a file, including the trailing empty block for exact multiples */
  uint64_t block_count(const size_t file_size);

  bool        is_finished(const phase_t phase);
  std::string phase_to_string(const phase_t phase);
  std::string result_to_string(const result_t result);

} // namespace tftp::transfer
