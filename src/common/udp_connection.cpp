#include "common/udp_connection.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>

#include "common/utils.hpp"

//========================================================
udp_connection::udp_connection() : _sd(-1)
{
  _sd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);

  if (_sd < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }

  const int enable = 1;
  if (setsockopt(_sd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(int)) < 0)
  {
    const int err = errno;
    close(_sd);
    throw std::runtime_error(utils::string_error(err));
  }
}

//========================================================
udp_connection::~udp_connection()
{
  if (_sd >= 0)
  {
    close(_sd);
  }
}

//========================================================
void udp_connection::set_non_blocking(const bool enable)
{
  int flags = fcntl(_sd, F_GETFL);
  if (flags < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  if (enable)
  {
    flags |= O_NONBLOCK;
  }
  else
  {
    flags &= ~O_NONBLOCK;
  }
  if (fcntl(_sd, F_SETFL, flags) < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
void udp_connection::bind(const std::string &ip_address, const uint16_t port_num)
{
  const auto sa = utils::to_sockaddr_in(ip_address, port_num);
  if (!sa)
  {
    throw std::runtime_error("Invalid address");
  }

  if (::bind(_sd, reinterpret_cast<const struct sockaddr *>(&sa.value()), sizeof(struct sockaddr_in)) < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
void udp_connection::connect(const struct sockaddr_in sa)
{
  if (::connect(_sd, reinterpret_cast<const struct sockaddr *>(&sa), sizeof(struct sockaddr_in)) < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
ssize_t udp_connection::send(const std::vector<char> &data)
{
  return ::send(_sd, data.data(), data.size(), 0);
}

//========================================================
ssize_t udp_connection::send_to(const struct sockaddr_in &sa, const std::vector<char> &data)
{
  return ::sendto(_sd, data.data(), data.size(), 0, reinterpret_cast<const struct sockaddr *>(&sa),
                  sizeof(struct sockaddr_in));
}

//========================================================
std::vector<char> udp_connection::recv(const size_t size)
{
  std::vector<char> buffer(size, 0);
  const ssize_t     received = ::recv(_sd, buffer.data(), size, 0);
  if ((received < 0) && ((errno == EAGAIN) || (errno == EWOULDBLOCK)))
  {
    return {};
  }
  else if (received < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }

  buffer.resize(static_cast<size_t>(received));
  return buffer;
}

//========================================================
std::vector<char> udp_connection::recv_from(struct sockaddr_in &sa, const size_t size)
{
  std::vector<char> buffer(size, 0);

  socklen_t sa_len = sizeof(sa);
  std::memset(&sa, 0, sizeof(struct sockaddr_in));

  const ssize_t received =
      ::recvfrom(_sd, buffer.data(), size, 0, reinterpret_cast<struct sockaddr *>(&sa), &sa_len);

  if ((received < 0) && ((errno == EAGAIN) || (errno == EWOULDBLOCK)))
  {
    return {};
  }
  else if (received < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }

  buffer.resize(static_cast<size_t>(received));
  return buffer;
}

//========================================================
struct sockaddr_in udp_connection::local_address() const
{
  struct sockaddr_in sa;
  socklen_t          sa_len = sizeof(sa);
  std::memset(&sa, 0, sizeof(struct sockaddr_in));

  if (getsockname(_sd, reinterpret_cast<struct sockaddr *>(&sa), &sa_len) < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  return sa;
}

//========================================================
uint16_t udp_connection::local_port() const
{
  return ntohs(local_address().sin_port);
}
