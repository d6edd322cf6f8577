#pragma once

#include <netinet/in.h>
#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

class udp_connection
{
public:
  udp_connection();
  udp_connection(const udp_connection &) = delete;
  udp_connection(udp_connection &&)      = delete;
  udp_connection &operator=(const udp_connection &) = delete;
  udp_connection &operator=(udp_connection &&) = delete;
  ~udp_connection();

  void               bind(const std::string &ip_address, const uint16_t port_num);
  void               connect(const struct sockaddr_in sa);
  ssize_t            send(const std::vector<char> &data);
  std::vector<char>  recv(const size_t size);
  ssize_t            send_to(const struct sockaddr_in &sa, const std::vector<char> &data);
  std::vector<char>  recv_from(struct sockaddr_in &sa, const size_t size);
  void               set_non_blocking(const bool enable);
  struct sockaddr_in local_address() const;
  uint16_t           local_port() const;

  int sd() const
  {
    return _sd;
  }

private:
  int _sd;
};
