#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <thread>
#include <vector>

#include "server/file_cache.hpp"
#include "tests/test_utils.hpp"

using namespace test_utils;

class file_cache_test : public ::testing::Test
{
protected:
  temp_directory dir;
};

TEST_F(file_cache_test, reads_whole_file)
{
  const auto content = make_content(1000);
  dir.write_file("boot.img", content);
  file_cache cache(dir.path(), logging::null_logger());

  const auto ret = cache.read("boot.img");

  ASSERT_TRUE(ret);
  EXPECT_EQ(*ret, content);
  EXPECT_TRUE(cache.contains("boot.img"));
  EXPECT_EQ(cache.bytes(), 1000U);
}

TEST_F(file_cache_test, empty_file)
{
  dir.write_file("empty", {});
  file_cache cache(dir.path(), logging::null_logger());

  const auto ret = cache.read("empty");

  ASSERT_TRUE(ret);
  EXPECT_TRUE(ret->empty());
}

TEST_F(file_cache_test, hit_does_not_touch_disk)
{
  const auto content = make_content(300);
  dir.write_file("a.bin", content);
  file_cache cache(dir.path(), logging::null_logger());

  const auto first = cache.read("a.bin");
  std::filesystem::remove(dir.path() / "a.bin");
  const auto second = cache.read("a.bin");

  EXPECT_EQ(cache.disk_reads(), 1U);
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(*second, content);
}

TEST_F(file_cache_test, missing_file)
{
  file_cache cache(dir.path(), logging::null_logger());

  EXPECT_THROW(cache.read("missing.bin"), file_not_found);
  EXPECT_FALSE(cache.contains("missing.bin"));
  EXPECT_EQ(cache.size(), 0U);
}

TEST_F(file_cache_test, missing_file_reports_name)
{
  file_cache cache(dir.path(), logging::null_logger());

  try
  {
    cache.read("nope/missing.bin");
    FAIL() << "Expected file_not_found";
  }
  catch (const file_not_found &err)
  {
    EXPECT_EQ(err.filename(), "nope/missing.bin");
  }
}

TEST_F(file_cache_test, missing_file_not_negatively_cached)
{
  file_cache cache(dir.path(), logging::null_logger());

  EXPECT_THROW(cache.read("late.bin"), file_not_found);
  dir.write_file("late.bin", make_content(10));

  EXPECT_EQ(cache.read("late.bin")->size(), 10U);
}

TEST_F(file_cache_test, directory_is_not_a_file)
{
  std::filesystem::create_directory(dir.path() / "subdir");
  file_cache cache(dir.path(), logging::null_logger());

  EXPECT_THROW(cache.read("subdir"), file_not_found);
}

TEST_F(file_cache_test, nested_path_below_root)
{
  std::filesystem::create_directory(dir.path() / "pxe");
  dir.write_file("pxe/kernel", make_content(64));
  file_cache cache(dir.path(), logging::null_logger());

  EXPECT_EQ(cache.read("pxe/kernel")->size(), 64U);
}

TEST_F(file_cache_test, absolute_name_resolves_below_root)
{
  dir.write_file("abs.bin", make_content(32));
  file_cache cache(dir.path(), logging::null_logger());

  EXPECT_EQ(cache.read("/abs.bin")->size(), 32U);
}

TEST_F(file_cache_test, least_recently_used_evicted_first)
{
  dir.write_file("a", make_content(60));
  dir.write_file("b", make_content(60));
  dir.write_file("c", make_content(60));
  file_cache cache(dir.path(), logging::null_logger(), 150);

  cache.read("a");
  cache.read("b");
  cache.read("a");
  cache.read("c");

  EXPECT_TRUE(cache.contains("a"));
  EXPECT_FALSE(cache.contains("b"));
  EXPECT_TRUE(cache.contains("c"));
  EXPECT_LE(cache.bytes(), 150U);
}

TEST_F(file_cache_test, evicted_file_is_read_again)
{
  dir.write_file("a", make_content(80));
  dir.write_file("b", make_content(80));
  file_cache cache(dir.path(), logging::null_logger(), 100);

  cache.read("a");
  cache.read("b");
  ASSERT_FALSE(cache.contains("a"));

  const std::vector<char> updated(80, 'z');
  dir.write_file("a", updated);

  EXPECT_EQ(*cache.read("a"), updated);
  EXPECT_EQ(cache.disk_reads(), 3U);
}

TEST_F(file_cache_test, oversize_file_served_but_not_retained)
{
  const auto content = make_content(2048);
  dir.write_file("big", content);
  file_cache cache(dir.path(), logging::null_logger(), 1024);

  EXPECT_EQ(*cache.read("big"), content);
  EXPECT_FALSE(cache.contains("big"));
  EXPECT_EQ(cache.bytes(), 0U);
}

TEST_F(file_cache_test, zero_max_age_always_rereads)
{
  dir.write_file("a", make_content(10));
  file_cache cache(dir.path(), logging::null_logger(), file_cache::DEFAULT_MAX_BYTES, std::chrono::seconds(0));

  cache.read("a");
  cache.read("a");

  EXPECT_EQ(cache.disk_reads(), 2U);
}

TEST_F(file_cache_test, clear_drops_everything)
{
  dir.write_file("a", make_content(10));
  file_cache cache(dir.path(), logging::null_logger());

  cache.read("a");
  cache.clear();

  EXPECT_EQ(cache.size(), 0U);
  EXPECT_EQ(cache.bytes(), 0U);
  cache.read("a");
  EXPECT_EQ(cache.disk_reads(), 2U);
}

TEST_F(file_cache_test, concurrent_reads_share_one_disk_read)
{
  const auto content = make_content(256 * 1024);
  dir.write_file("shared.img", content);
  file_cache cache(dir.path(), logging::null_logger());

  const size_t                       NUM_THREADS = 8;
  std::vector<file_cache::content_t> results(NUM_THREADS);
  std::vector<std::thread>           threads;
  for (size_t i = 0; i < NUM_THREADS; ++i)
  {
    threads.emplace_back([&cache, &results, i]() { results[i] = cache.read("shared.img"); });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  EXPECT_EQ(cache.disk_reads(), 1U);
  for (const auto &r : results)
  {
    ASSERT_TRUE(r);
    EXPECT_EQ(r.get(), results[0].get());
  }
  EXPECT_EQ(*results[0], content);
}

TEST_F(file_cache_test, file_too_large_for_memory_is_not_found)
{
  dir.write_sparse_file("huge.img", 1024ULL * 1024 * 1024);
  file_cache cache(dir.path(), logging::null_logger());

  EXPECT_EXIT(
      {
        limit_address_space(128 * 1024 * 1024);
        try
        {
          cache.read("huge.img");
        }
        catch (const file_not_found &)
        {
          _exit(cache.contains("huge.img") ? 2 : 0);
        }
        _exit(1);
      },
      ::testing::ExitedWithCode(0), "");
}
