#include "common/utils.hpp"

#include <algorithm>
#include <cstring>

#include <fmt/format.h>

//========================================================
std::optional<struct sockaddr_in> utils::to_sockaddr_in(const std::string &addr, const uint16_t port)
{
  struct sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_port   = htons(port);
  sa.sin_family = AF_INET;
  if (addr.empty())
  {
    sa.sin_addr.s_addr = INADDR_ANY;
  }
  else
  {
    if (!inet_pton(AF_INET, addr.c_str(), &(sa.sin_addr)))
    {
      return {};
    }
  }
  return sa;
}

//========================================================
std::ostream &operator<<(std::ostream &os, const struct sockaddr_in &sa)
{
  return os << fmt::format("{}", sa);
}

//========================================================
std::vector<std::string> utils::extract_c_strings_from_buffer(const std::vector<char> &buffer, const size_t offset)
{
  std::vector<std::string> ret;
  if (offset >= buffer.size())
  {
    return ret;
  }

  auto start = buffer.begin() + offset;
  for (auto end = std::find(start, buffer.end(), 0); end != buffer.end(); end = std::find(start, buffer.end(), 0))
  {
    ret.emplace_back(start, end);
    start = std::next(end);
  }
  return ret;
}
