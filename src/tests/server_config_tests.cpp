#include <gtest/gtest.h>

#include <unistd.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "server/privileges.hpp"
#include "server/server_config.hpp"

namespace
{
  /* getopt wants a mutable, null terminated argv */
  class command_line
  {
  public:
    command_line(std::initializer_list<std::string> args) : _args(args)
    {
      for (auto &a : _args)
      {
        _argv.push_back(a.data());
      }
      _argv.push_back(nullptr);
    }

    int argc() const
    {
      return static_cast<int>(_args.size());
    }

    char **argv()
    {
      return _argv.data();
    }

  private:
    std::vector<std::string> _args;
    std::vector<char *>      _argv;
  };
} // namespace

TEST(parse_command_line, root_only_uses_defaults)
{
  command_line cl{"tftpd", "-r", "/srv/tftp"};

  const auto config = parse_command_line(cl.argc(), cl.argv());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->server_root, "/srv/tftp");
  EXPECT_EQ(config->interface, "0.0.0.0");
  EXPECT_EQ(config->port, 69);
  EXPECT_EQ(config->max_clients, 100U);
  EXPECT_EQ(config->timeout, std::chrono::milliseconds(1000));
  EXPECT_EQ(config->cache_max_bytes, file_cache::DEFAULT_MAX_BYTES);
  EXPECT_TRUE(config->user.empty());
  EXPECT_TRUE(config->group.empty());
  EXPECT_TRUE(config->hooks.empty());
  EXPECT_FALSE(config->verbose);
}

TEST(parse_command_line, all_short_options)
{
  command_line cl{"tftpd", "-r", "/srv", "-i", "127.0.0.1", "-p", "6969", "-u", "nobody", "-g",
                  "nogroup", "-c", "5", "-t", "250", "-m", "4096", "-v"};

  const auto config = parse_command_line(cl.argc(), cl.argv());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->server_root, "/srv");
  EXPECT_EQ(config->interface, "127.0.0.1");
  EXPECT_EQ(config->port, 6969);
  EXPECT_EQ(config->user, "nobody");
  EXPECT_EQ(config->group, "nogroup");
  EXPECT_EQ(config->max_clients, 5U);
  EXPECT_EQ(config->timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(config->cache_max_bytes, 4096U);
  EXPECT_TRUE(config->verbose);
}

TEST(parse_command_line, long_options)
{
  command_line cl{"tftpd", "--root=/srv", "--port", "1069", "--timeout", "50", "--verbose"};

  const auto config = parse_command_line(cl.argc(), cl.argv());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->server_root, "/srv");
  EXPECT_EQ(config->port, 1069);
  EXPECT_EQ(config->timeout, std::chrono::milliseconds(50));
  EXPECT_TRUE(config->verbose);
}

TEST(parse_command_line, hooks_accumulate_in_order)
{
  command_line cl{"tftpd", "-r", "/srv", "-k", "audit", "--hook", "pxe-stats"};

  const auto config = parse_command_line(cl.argc(), cl.argv());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->hooks, (std::vector<std::string>{"audit", "pxe-stats"}));
}

TEST(parse_command_line, can_run_twice)
{
  command_line first{"tftpd", "-r", "/a", "-p", "1"};
  command_line second{"tftpd", "-r", "/b", "-p", "2"};

  const auto a = parse_command_line(first.argc(), first.argv());
  const auto b = parse_command_line(second.argc(), second.argv());

  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->server_root, "/b");
  EXPECT_EQ(b->port, 2);
}

TEST(parse_command_line, root_required)
{
  command_line cl{"tftpd", "-p", "69"};

  EXPECT_FALSE(parse_command_line(cl.argc(), cl.argv()).has_value());
}

TEST(parse_command_line, invalid_numbers)
{
  for (const auto &args : std::vector<std::vector<std::string>>{{"-p", "65536"},
                                                                {"-p", "-1"},
                                                                {"-p", "69x"},
                                                                {"-c", "0"},
                                                                {"-t", "0"},
                                                                {"-t", "soon"},
                                                                {"-m", ""}})
  {
    command_line cl{"tftpd", "-r", "/srv", args[0], args[1]};
    EXPECT_FALSE(parse_command_line(cl.argc(), cl.argv()).has_value()) << args[0] << " " << args[1];
  }
}

TEST(parse_command_line, invalid_interface)
{
  command_line cl{"tftpd", "-r", "/srv", "-i", "eth0"};

  EXPECT_FALSE(parse_command_line(cl.argc(), cl.argv()).has_value());
}

TEST(parse_command_line, unknown_option)
{
  command_line cl{"tftpd", "-r", "/srv", "--write-enable"};

  EXPECT_FALSE(parse_command_line(cl.argc(), cl.argv()).has_value());
}

TEST(parse_command_line, stray_argument)
{
  command_line cl{"tftpd", "-r", "/srv", "extra"};

  EXPECT_FALSE(parse_command_line(cl.argc(), cl.argv()).has_value());
}

TEST(parse_command_line, help)
{
  command_line cl{"tftpd", "-h"};

  EXPECT_FALSE(parse_command_line(cl.argc(), cl.argv()).has_value());
}

TEST(drop_privileges, nothing_requested)
{
  const auto uid = getuid();

  EXPECT_NO_THROW(privileges::drop_privileges("", "", logging::null_logger()));
  EXPECT_EQ(getuid(), uid);
}

TEST(drop_privileges, unknown_user)
{
  EXPECT_THROW(privileges::drop_privileges("tftpd-no-such-user", "", logging::null_logger()), std::runtime_error);
}

TEST(drop_privileges, unknown_group)
{
  EXPECT_THROW(privileges::drop_privileges("", "tftpd-no-such-group", logging::null_logger()), std::runtime_error);
}
