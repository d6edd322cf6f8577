#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tftp
{

  static const size_t DATA_PKT_MAX_SIZE      = 516;
  static const size_t DATA_PKT_DATA_MAX_SIZE = 512;
  static const size_t ACK_PKT_MAX_SIZE       = 4;
  static const size_t RECV_BUFFER_SIZE       = 2048;

  enum class packet_t : uint8_t
  {
    UNKNOWN = 0,
    READ,
    WRITE,
    DATA,
    ACK,
    ERROR
  };

  enum class mode_t
  {
    NETASCII,
    OCTET,
    MAIL
  };

  enum class error_t : uint16_t
  {
    NOT_DEFINED,
    FILE_NOT_FOUND,
    ACCESS_ERROR,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_EXISTS,
    NO_USER
  };

  std::string error_code_to_string(const error_t err);
  std::string packet_type_to_string(const packet_t type);

  struct rw_packet_t
  {
    rw_packet_t() : type(packet_t::READ), filename(""), mode(""){};
    rw_packet_t(const std::string &f, const packet_t t, const std::string &m) : type(t), filename(f), mode(m){};
    packet_t    type;
    std::string filename;
    std::string mode; // raw mode string as sent by the client
  };

  struct data_packet_t
  {
    data_packet_t() : data{}, block_number(0){};
    data_packet_t(const uint16_t bn, const std::vector<char> &d) : data(d), block_number(bn){};
    std::vector<char> data;
    uint16_t          block_number;
  };

  struct ack_packet_t
  {
    explicit ack_packet_t(const uint16_t bn) : block_number(bn){};
    uint16_t block_number;
  };

  struct error_packet_t
  {
    error_packet_t() : error_msg(""), error_code(0){};
    error_packet_t(const error_t code, const std::string &msg) :
        error_msg(msg), error_code(static_cast<uint16_t>(code)){};
    std::string error_msg;
    uint16_t    error_code;
  };

  bool operator==(const rw_packet_t &lhs, const rw_packet_t &rhs);
  bool operator==(const data_packet_t &lhs, const data_packet_t &rhs);
  bool operator==(const ack_packet_t &lhs, const ack_packet_t &rhs);
  bool operator==(const error_packet_t &lhs, const error_packet_t &rhs);

  using packet_variant_t = std::variant<rw_packet_t, data_packet_t, ack_packet_t, error_packet_t>;

  /* Leading opcode of a datagram, UNKNOWN if it is too short or not one of the five RFC 1350 opcodes */
  packet_t packet_type(const std::vector<char> &data);

  std::vector<char> serialise_rw_packet(const rw_packet_t &packet);
  std::vector<char> serialise_data_packet(const data_packet_t &packet);
  std::vector<char> serialise_ack_packet(const ack_packet_t &packet);
  std::vector<char> serialise_error_packet(const error_packet_t &packet);
  std::vector<char> serialise_packet(const packet_variant_t &packet);

  std::optional<rw_packet_t>      deserialise_rw_packet(const std::vector<char> &data);
  std::optional<data_packet_t>    deserialise_data_packet(const std::vector<char> &data);
  std::optional<ack_packet_t>     deserialise_ack_packet(const std::vector<char> &data);
  std::optional<error_packet_t>   deserialise_error_packet(const std::vector<char> &data);
  std::optional<packet_variant_t> deserialise_packet(const std::vector<char> &data);

  /* Case-insensitive, nullopt for anything other than the three RFC 1350 modes */
  std::optional<mode_t> string_to_mode_t(std::string mode_str);

} // namespace tftp
