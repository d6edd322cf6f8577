#include "common/tftp.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "common/utils.hpp"

namespace
{
  const char OCTET_MODE_STR[]    = "OCTET";
  const char NETASCII_MODE_STR[] = "NETASCII";
  const char MAIL_MODE_STR[]     = "MAIL";

  uint16_t read_u16(const std::vector<char> &data, const size_t offset)
  {
    return (static_cast<uint16_t>(static_cast<unsigned char>(data.at(offset))) << 8) |
           static_cast<uint16_t>(static_cast<unsigned char>(data.at(offset + 1)));
  }

  void write_u16(std::vector<char> &data, const uint16_t value)
  {
    data.push_back(static_cast<char>(value >> 8));
    data.push_back(static_cast<char>(value & 0xFF));
  }
}; // namespace

//========================================================
bool tftp::operator==(const rw_packet_t &lhs, const rw_packet_t &rhs)
{
  return (lhs.type == rhs.type) && (lhs.filename == rhs.filename) && (lhs.mode == rhs.mode);
}

//========================================================
bool tftp::operator==(const data_packet_t &lhs, const data_packet_t &rhs)
{
  return (lhs.block_number == rhs.block_number) && (lhs.data == rhs.data);
}

//========================================================
bool tftp::operator==(const ack_packet_t &lhs, const ack_packet_t &rhs)
{
  return lhs.block_number == rhs.block_number;
}

//========================================================
bool tftp::operator==(const error_packet_t &lhs, const error_packet_t &rhs)
{
  return (lhs.error_code == rhs.error_code) && (lhs.error_msg == rhs.error_msg);
}

//========================================================
tftp::packet_t tftp::packet_type(const std::vector<char> &data)
{
  if (data.size() < 2)
  {
    return packet_t::UNKNOWN;
  }

  switch (read_u16(data, 0))
  {
  case static_cast<uint16_t>(packet_t::READ):
    return packet_t::READ;
  case static_cast<uint16_t>(packet_t::WRITE):
    return packet_t::WRITE;
  case static_cast<uint16_t>(packet_t::DATA):
    return packet_t::DATA;
  case static_cast<uint16_t>(packet_t::ACK):
    return packet_t::ACK;
  case static_cast<uint16_t>(packet_t::ERROR):
    return packet_t::ERROR;
  default:
    return packet_t::UNKNOWN;
  }
}

//========================================================
std::vector<char> tftp::serialise_rw_packet(const rw_packet_t &packet)
{
  const size_t packet_size =
      2 + packet.filename.size() + 1 + packet.mode.size() + 1; // opcode + filename + null byte + mode + null_byte
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet.type));
  ret.insert(ret.end(), packet.filename.begin(), packet.filename.end());
  ret.push_back(0);
  ret.insert(ret.end(), packet.mode.begin(), packet.mode.end());
  ret.push_back(0);
  return ret;
}

//========================================================
std::optional<tftp::rw_packet_t> tftp::deserialise_rw_packet(const std::vector<char> &data)
{
  rw_packet_t packet;
  const auto  type = packet_type(data);
  if ((data.size() < 4) || ((type != packet_t::READ) && (type != packet_t::WRITE)))
  {
    return {};
  }
  packet.type = type;

  std::vector<std::string> params = utils::extract_c_strings_from_buffer(data, 2);
  if (params.size() < 2)
  {
    return {};
  }
  // Anything after the mode would be RFC 2347 options, which are not negotiated
  packet.filename = std::move(params[0]);
  packet.mode     = std::move(params[1]);
  return packet;
}

//========================================================
std::vector<char> tftp::serialise_data_packet(const data_packet_t &packet)
{
  const size_t      packet_size = 2 + 2 + packet.data.size(); // opcode + block_number + data
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet_t::DATA));
  write_u16(ret, packet.block_number);
  ret.insert(ret.end(), packet.data.begin(), packet.data.end());
  return ret;
}

//========================================================
std::optional<tftp::data_packet_t> tftp::deserialise_data_packet(const std::vector<char> &data)
{
  data_packet_t packet;
  if ((data.size() < 4) || (data.size() > DATA_PKT_MAX_SIZE) || (packet_type(data) != packet_t::DATA))
  {
    return {};
  }

  packet.block_number = read_u16(data, 2);
  packet.data.assign(data.begin() + 4, data.end());
  return packet;
}

//========================================================
std::vector<char> tftp::serialise_ack_packet(const ack_packet_t &packet)
{
  const size_t      packet_size = 2 + 2; // opcode + block_number
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet_t::ACK));
  write_u16(ret, packet.block_number);
  return ret;
}

//========================================================
std::optional<tftp::ack_packet_t> tftp::deserialise_ack_packet(const std::vector<char> &data)
{
  if ((data.size() < 4) || (packet_type(data) != packet_t::ACK))
  {
    return {};
  }
  return ack_packet_t(read_u16(data, 2));
}

//========================================================
std::vector<char> tftp::serialise_error_packet(const error_packet_t &packet)
{
  const size_t      packet_size = 2 + 2 + packet.error_msg.size() + 1; // opcode + erron_num + error_msg + null byte
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet_t::ERROR));
  write_u16(ret, packet.error_code);
  ret.insert(ret.end(), packet.error_msg.begin(), packet.error_msg.end());
  ret.push_back(0);
  return ret;
}

//========================================================
std::optional<tftp::error_packet_t> tftp::deserialise_error_packet(const std::vector<char> &data)
{
  error_packet_t packet;
  if ((data.size() < 5) || (packet_type(data) != packet_t::ERROR))
  {
    return {};
  }

  packet.error_code = read_u16(data, 2);

  const auto null = std::find(data.begin() + 4, data.end(), 0);
  if (null == data.end())
  {
    return {};
  }
  packet.error_msg = std::string(data.begin() + 4, null);
  return packet;
}

//========================================================
std::vector<char> tftp::serialise_packet(const packet_variant_t &packet)
{
  switch (packet.index())
  {
  case 0:
    return serialise_rw_packet(std::get<rw_packet_t>(packet));
  case 1:
    return serialise_data_packet(std::get<data_packet_t>(packet));
  case 2:
    return serialise_ack_packet(std::get<ack_packet_t>(packet));
  case 3:
  default:
    return serialise_error_packet(std::get<error_packet_t>(packet));
  }
}

//========================================================
std::optional<tftp::packet_variant_t> tftp::deserialise_packet(const std::vector<char> &data)
{
  switch (packet_type(data))
  {
  case packet_t::READ:
  case packet_t::WRITE: {
    auto packet = deserialise_rw_packet(data);
    if (packet)
    {
      return packet_variant_t(std::move(packet.value()));
    }
    break;
  }
  case packet_t::DATA: {
    auto packet = deserialise_data_packet(data);
    if (packet)
    {
      return packet_variant_t(std::move(packet.value()));
    }
    break;
  }
  case packet_t::ACK: {
    const auto packet = deserialise_ack_packet(data);
    if (packet)
    {
      return packet_variant_t(packet.value());
    }
    break;
  }
  case packet_t::ERROR: {
    auto packet = deserialise_error_packet(data);
    if (packet)
    {
      return packet_variant_t(std::move(packet.value()));
    }
    break;
  }
  case packet_t::UNKNOWN:
  default: {
    break;
  }
  }
  return {};
}

//========================================================
std::optional<tftp::mode_t> tftp::string_to_mode_t(std::string mode_str)
{
  std::transform(mode_str.begin(), mode_str.end(), mode_str.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (std::strcmp(mode_str.c_str(), OCTET_MODE_STR) == 0)
  {
    return mode_t::OCTET;
  }
  else if (std::strcmp(mode_str.c_str(), NETASCII_MODE_STR) == 0)
  {
    return mode_t::NETASCII;
  }
  else if (std::strcmp(mode_str.c_str(), MAIL_MODE_STR) == 0)
  {
    return mode_t::MAIL;
  }

  return {};
}

//========================================================
std::string tftp::packet_type_to_string(const tftp::packet_t type)
{
  switch (type)
  {
  case packet_t::READ:
    return std::string("RRQ");
  case packet_t::WRITE:
    return std::string("WRQ");
  case packet_t::DATA:
    return std::string("DATA");
  case packet_t::ACK:
    return std::string("ACK");
  case packet_t::ERROR:
    return std::string("ERROR");
  case packet_t::UNKNOWN:
  default:
    return std::string("UNKNOWN");
  }
}

//========================================================
std::string tftp::error_code_to_string(const tftp::error_t err)
{
  switch (err)
  {
  default:
  case error_t::NOT_DEFINED: {
    return std::string("Not defined");
  }
  case error_t::FILE_NOT_FOUND: {
    return std::string("File not found");
  }
  case error_t::ACCESS_ERROR: {
    return std::string("Access violation");
  }
  case error_t::DISK_FULL: {
    return std::string("Disk full or allocation exceeded");
  }
  case error_t::ILLEGAL_OPERATION: {
    return std::string("Illegal TFTP operation");
  }
  case error_t::UNKNOWN_TID: {
    return std::string("Unknown transfer ID");
  }
  case error_t::FILE_EXISTS: {
    return std::string("File already exists");
  }
  case error_t::NO_USER: {
    return std::string("No such user");
  }
  }
  return std::string("");
}
