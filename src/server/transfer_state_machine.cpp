#include "server/transfer_state_machine.hpp"

#include <algorithm>

namespace
{
  using namespace tftp::transfer;

  transition_t unchanged(const state_t &state)
  {
    return transition_t{state, {}, result_t::IGNORED};
  }

  /* Moves to the next block, serialising its DATA packet in to last_packet */
  void next_block(state_t &state)
  {
    state.block_index += 1;
    state.block_number = static_cast<uint16_t>(state.block_index);

    const auto  &content = *state.content;
    const size_t offset  = std::min<uint64_t>((state.block_index - 1) * BLOCK_SIZE, content.size());
    const size_t len     = std::min(BLOCK_SIZE, content.size() - offset);

    tftp::data_packet_t packet;
    packet.block_number = state.block_number;
    packet.data.assign(content.begin() + offset, content.begin() + offset + len);

    state.terminal_block = len < BLOCK_SIZE;
    state.last_packet    = tftp::serialise_data_packet(packet);
    state.retries_left   = RETRY_COUNT;
  }
}; // namespace

const char tftp::transfer::NOT_FOUND_MSG[] = "No found :(";

//========================================================
tftp::transfer::transition_t tftp::transfer::on_file_loaded(const state_t                           &state,
                                                            std::shared_ptr<const std::vector<char>> content)
{
  if ((state.phase != phase_t::START) || !content)
  {
    return unchanged(state);
  }

  transition_t ret{state, {}, result_t::BLOCK_SENT};
  ret.state.content = std::move(content);
  next_block(ret.state);
  ret.state.phase = phase_t::AWAIT_ACK;
  ret.effects     = {effect_t::SEND_PACKET, effect_t::ARM_TIMER};
  return ret;
}

//========================================================
tftp::transfer::transition_t tftp::transfer::on_file_missing(const state_t &state)
{
  if (state.phase != phase_t::START)
  {
    return unchanged(state);
  }

  transition_t ret{state, {}, result_t::NOT_FOUND};
  ret.state.last_packet =
      serialise_error_packet(error_packet_t(error_t::FILE_NOT_FOUND, std::string(NOT_FOUND_MSG)));
  ret.state.phase = phase_t::ERRORED;
  // The timer only reaps the session if the client never answers, the ERROR itself is never resent
  ret.effects = {effect_t::SEND_PACKET, effect_t::ARM_TIMER};
  return ret;
}

//========================================================
tftp::transfer::transition_t tftp::transfer::on_ack(const state_t &state, const uint16_t block_number)
{
  switch (state.phase)
  {
  case phase_t::AWAIT_ACK: {
    if (block_number == state.block_number)
    {
      if (state.terminal_block)
      {
        transition_t ret{state, {effect_t::CANCEL_TIMER, effect_t::RELEASE}, result_t::COMPLETED};
        ret.state.phase = phase_t::DONE;
        return ret;
      }

      transition_t ret{state, {effect_t::CANCEL_TIMER, effect_t::SEND_PACKET, effect_t::ARM_TIMER},
                       result_t::BLOCK_SENT};
      next_block(ret.state);
      return ret;
    }

    if (block_number == static_cast<uint16_t>(state.block_number - 1))
    {
      return transition_t{state, {effect_t::SEND_PACKET, effect_t::ARM_TIMER}, result_t::DUPLICATE_ACK};
    }

    transition_t ret{state, {effect_t::CANCEL_TIMER, effect_t::RELEASE}, result_t::PROTOCOL_VIOLATION};
    ret.state.phase = phase_t::FAILED;
    return ret;
  }
  case phase_t::ERRORED: {
    transition_t ret{state, {effect_t::CANCEL_TIMER, effect_t::RELEASE}, result_t::ERROR_ACKED};
    ret.state.phase = phase_t::CLOSED;
    return ret;
  }
  case phase_t::START:
  case phase_t::DONE:
  case phase_t::FAILED:
  case phase_t::CLOSED:
  default: {
    return unchanged(state);
  }
  }
}

//========================================================
tftp::transfer::transition_t tftp::transfer::on_client_error(const state_t &state)
{
  switch (state.phase)
  {
  case phase_t::AWAIT_ACK: {
    transition_t ret{state, {effect_t::CANCEL_TIMER, effect_t::RELEASE}, result_t::CLIENT_ERROR};
    ret.state.phase = phase_t::FAILED;
    return ret;
  }
  case phase_t::ERRORED: {
    transition_t ret{state, {effect_t::CANCEL_TIMER, effect_t::RELEASE}, result_t::CLIENT_ERROR};
    ret.state.phase = phase_t::CLOSED;
    return ret;
  }
  case phase_t::START:
  case phase_t::DONE:
  case phase_t::FAILED:
  case phase_t::CLOSED:
  default: {
    return unchanged(state);
  }
  }
}

//========================================================
tftp::transfer::transition_t tftp::transfer::on_timeout(const state_t &state)
{
  switch (state.phase)
  {
  case phase_t::AWAIT_ACK: {
    if (state.retries_left == 0)
    {
      transition_t ret{state, {effect_t::RELEASE}, result_t::RETRIES_EXHAUSTED};
      ret.state.phase = phase_t::FAILED;
      return ret;
    }

    transition_t ret{state, {effect_t::SEND_PACKET, effect_t::ARM_TIMER}, result_t::RETRANSMIT};
    ret.state.retries_left -= 1;
    return ret;
  }
  case phase_t::ERRORED: {
    transition_t ret{state, {effect_t::RELEASE}, result_t::LINGER_EXPIRED};
    ret.state.phase = phase_t::CLOSED;
    return ret;
  }
  case phase_t::START:
  case phase_t::DONE:
  case phase_t::FAILED:
  case phase_t::CLOSED:
  default: {
    return unchanged(state);
  }
  }
}

//========================================================
uint64_t tftp::transfer::block_count(const size_t file_size)
{
  return (file_size / BLOCK_SIZE) + 1;
}

//========================================================
bool tftp::transfer::is_finished(const phase_t phase)
{
  return (phase == phase_t::DONE) || (phase == phase_t::FAILED) || (phase == phase_t::CLOSED);
}

//========================================================
std::string tftp::transfer::phase_to_string(const phase_t phase)
{
  switch (phase)
  {
  case phase_t::START:
    return std::string("START");
  case phase_t::AWAIT_ACK:
    return std::string("AWAIT_ACK");
  case phase_t::DONE:
    return std::string("DONE");
  case phase_t::FAILED:
    return std::string("FAILED");
  case phase_t::ERRORED:
    return std::string("ERRORED");
  case phase_t::CLOSED:
    return std::string("CLOSED");
  default:
    return std::string("UNKNOWN");
  }
}

//========================================================
std::string tftp::transfer::result_to_string(const result_t result)
{
  switch (result)
  {
  case result_t::BLOCK_SENT:
    return std::string("block sent");
  case result_t::DUPLICATE_ACK:
    return std::string("duplicate ack");
  case result_t::RETRANSMIT:
    return std::string("retransmit");
  case result_t::COMPLETED:
    return std::string("completed");
  case result_t::RETRIES_EXHAUSTED:
    return std::string("retries exhausted");
  case result_t::PROTOCOL_VIOLATION:
    return std::string("protocol violation");
  case result_t::NOT_FOUND:
    return std::string("not found");
  case result_t::ERROR_ACKED:
    return std::string("error acknowledged");
  case result_t::CLIENT_ERROR:
    return std::string("client error");
  case result_t::LINGER_EXPIRED:
    return std::string("linger expired");
  case result_t::IGNORED:
  default:
    return std::string("ignored");
  }
}
