#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/debug_macros.hpp"

/* Raised for any file that cannot be served: missing, not a regular file, unreadable */
class file_not_found : public std::runtime_error
{
public:
  explicit file_not_found(const std::string &filename) :
      std::runtime_error("File not found : " + filename), _filename(filename){};

  const std::string &filename() const
  {
    return _filename;
  }

private:
  std::string _filename;
};

/**
 * @brief Whole-file content cache keyed by the requested filename
 *
 * Files are read from disk at most once while they stay cached. Entries are evicted least recently
 * used first once the byte budget is exceeded, and re-read when older than the optional max age.
 * Concurrent misses on the same key share a single disk read.
 */
class file_cache
{
public:
  using clock_t   = std::chrono::steady_clock;
  using content_t = std::shared_ptr<const std::vector<char>>;

  static constexpr size_t DEFAULT_MAX_BYTES = 64 * 1024 * 1024;

  file_cache(const std::filesystem::path &root, logging::logger_t logger, const size_t max_bytes = DEFAULT_MAX_BYTES,
             const std::optional<std::chrono::seconds> max_age = std::nullopt);
  file_cache(const file_cache &) = delete;
  file_cache(file_cache &&)      = delete;
  file_cache &operator=(const file_cache &) = delete;
  file_cache &operator=(file_cache &&) = delete;
  ~file_cache();

  content_t read(const std::string &filename);

  bool   contains(const std::string &filename) const;
  size_t size() const;
  size_t bytes() const;
  size_t disk_reads() const;
  void   clear();

  const std::filesystem::path &root() const;

private:
  struct entry_t
  {
    content_t                        content;
    clock_t::time_point              fetched;
    std::list<std::string>::iterator lru_pos;
  };

  logging::logger_t                                    _logger;
  const std::filesystem::path                          _root;
  const size_t                                         _max_bytes;
  const std::optional<std::chrono::seconds>            _max_age;
  mutable std::mutex                                   _mutex;
  std::map<std::string, entry_t>                       _entries;
  std::map<std::string, std::shared_future<content_t>> _in_flight;
  std::list<std::string>                               _lru; // front is most recently used
  size_t                                               _bytes;
  size_t                                               _disk_reads;

  content_t load(const std::string &filename) const;
  void      store(const std::string &filename, const content_t &content);
  void      erase(std::map<std::string, entry_t>::iterator iter);
  void      evict();
};
