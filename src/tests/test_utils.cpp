#include "tests/test_utils.hpp"

#include <poll.h>
#include <sys/resource.h>
#include <unistd.h>

#include <fmt/core.h>

#include <atomic>
#include <fstream>
#include <stdexcept>

//========================================================
std::vector<char> test_utils::make_content(const size_t size)
{
  std::vector<char> ret(size);
  for (size_t i = 0; i < size; ++i)
  {
    ret[i] = static_cast<char>((i * 7 + i / 509) & 0xFF);
  }
  return ret;
}

//========================================================
void test_utils::limit_address_space(const size_t headroom)
{
  std::ifstream statm("/proc/self/statm");
  size_t        pages = 0;
  if (!(statm >> pages))
  {
    throw std::runtime_error("Failed to read /proc/self/statm");
  }

  struct rlimit limit;
  limit.rlim_cur = pages * static_cast<size_t>(sysconf(_SC_PAGESIZE)) + headroom;
  limit.rlim_max = limit.rlim_cur;
  if (setrlimit(RLIMIT_AS, &limit) < 0)
  {
    throw std::runtime_error("Failed to limit the address space");
  }
}

//========================================================
test_utils::temp_directory::temp_directory()
{
  static std::atomic<unsigned> counter(0);
  _path = std::filesystem::temp_directory_path() / fmt::format("tftpd-test-{}-{}", getpid(), counter++);
  std::filesystem::remove_all(_path);
  std::filesystem::create_directories(_path);
}

//========================================================
test_utils::temp_directory::~temp_directory()
{
  std::error_code err;
  std::filesystem::remove_all(_path, err);
}

//========================================================
const std::filesystem::path &test_utils::temp_directory::path() const
{
  return _path;
}

//========================================================
void test_utils::temp_directory::write_file(const std::string &name, const std::vector<char> &content) const
{
  const auto    filepath = _path / name;
  std::ofstream stream(filepath, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!stream.is_open())
  {
    throw std::runtime_error("Failed to create " + filepath.string());
  }
  stream.write(content.data(), static_cast<std::streamsize>(content.size()));
}

//========================================================
void test_utils::temp_directory::write_sparse_file(const std::string &name, const uintmax_t size) const
{
  write_file(name, {});
  std::filesystem::resize_file(_path / name, size);
}

//========================================================
test_utils::test_client::test_client() : _udp()
{
  _udp.bind("127.0.0.1", 0);
  _udp.set_non_blocking(true);
}

//========================================================
void test_utils::test_client::send_to(const struct sockaddr_in &to, const std::vector<char> &data)
{
  if (_udp.send_to(to, data) != static_cast<ssize_t>(data.size()))
  {
    throw std::runtime_error("Test client send failed");
  }
}

//========================================================
std::optional<std::vector<char>> test_utils::test_client::receive(struct sockaddr_in           &from,
                                                                  const std::chrono::milliseconds timeout)
{
  struct pollfd pfd;
  pfd.fd      = _udp.sd();
  pfd.events  = POLLIN;
  pfd.revents = 0;

  const int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ret <= 0)
  {
    return std::nullopt;
  }
  return _udp.recv_from(from, 2048);
}
