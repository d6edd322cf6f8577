#include "server/file_cache.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

//========================================================
file_cache::file_cache(const std::filesystem::path &root, logging::logger_t logger, const size_t max_bytes,
                       const std::optional<std::chrono::seconds> max_age) :
    _logger(std::move(logger)),
    _root(root),
    _max_bytes(max_bytes),
    _max_age(max_age),
    _mutex(),
    _entries{},
    _in_flight{},
    _lru{},
    _bytes(0),
    _disk_reads(0)
{
  log_debug(_logger, "File cache serving '{}' with a budget of {} bytes", _root.string(), _max_bytes);
}

//========================================================
file_cache::~file_cache() = default;

//========================================================
const std::filesystem::path &file_cache::root() const
{
  return _root;
}

//========================================================
/**
 * @brief Returns the full contents of a file below the cache root
 *
 * A hit never touches the disk. A miss reads the whole file and stores it before returning. If another
 * caller is already reading the same file this call waits for that read instead of issuing its own.
 *
 * @throws file_not_found if the file is missing or cannot be read
 */
file_cache::content_t file_cache::read(const std::string &filename)
{
  std::unique_lock<std::mutex> lock(_mutex);

  auto iter = _entries.find(filename);
  if (iter != _entries.end())
  {
    if (!_max_age || ((clock_t::now() - iter->second.fetched) < _max_age.value()))
    {
      _lru.splice(_lru.begin(), _lru, iter->second.lru_pos);
      log_trace(_logger, "Cache hit for '{}' ({} bytes)", filename, iter->second.content->size());
      return iter->second.content;
    }
    log_debug(_logger, "Cache entry for '{}' is stale, re-reading", filename);
    erase(iter);
  }

  const auto flight = _in_flight.find(filename);
  if (flight != _in_flight.end())
  {
    auto pending = flight->second;
    lock.unlock();
    log_trace(_logger, "Waiting on in-flight read of '{}'", filename);
    return pending.get();
  }

  std::promise<content_t> promise;
  _in_flight.emplace(filename, promise.get_future().share());
  ++_disk_reads;
  lock.unlock();

  content_t content;
  try
  {
    content = load(filename);
  }
  catch (const std::exception &)
  {
    promise.set_exception(std::current_exception());
    lock.lock();
    _in_flight.erase(filename);
    throw;
  }

  lock.lock();
  store(filename, content);
  _in_flight.erase(filename);
  lock.unlock();

  promise.set_value(content);
  return content;
}

//========================================================
bool file_cache::contains(const std::string &filename) const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries.find(filename) != _entries.end();
}

//========================================================
size_t file_cache::size() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries.size();
}

//========================================================
size_t file_cache::bytes() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _bytes;
}

//========================================================
size_t file_cache::disk_reads() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _disk_reads;
}

//========================================================
void file_cache::clear()
{
  std::lock_guard<std::mutex> lock(_mutex);
  _entries.clear();
  _lru.clear();
  _bytes = 0;
}

//========================================================
file_cache::content_t file_cache::load(const std::string &filename) const
{
  const auto      filepath = _root / std::filesystem::path(filename).relative_path();
  std::error_code err;

  if (!std::filesystem::is_regular_file(filepath, err))
  {
    log_debug(_logger, "'{}' is not a regular file : {}", filepath.string(),
              err ? err.message() : std::string("not a file"));
    throw file_not_found(filename);
  }

  std::ifstream stream(filepath, std::ios::in | std::ios::binary);
  if (!stream.is_open())
  {
    log_debug(_logger, "Failed to open '{}' for reading", filepath.string());
    throw file_not_found(filename);
  }

  std::shared_ptr<std::vector<char>> data;
  try
  {
    data = std::make_shared<std::vector<char>>(std::istreambuf_iterator<char>(stream),
                                               std::istreambuf_iterator<char>());
  }
  catch (const std::exception &err)
  {
    // bad_alloc or length_error for files that do not fit in memory
    log_warn(_logger, "Failed to read '{}' : {}", filepath.string(), err.what());
    throw file_not_found(filename);
  }

  if (stream.bad())
  {
    log_warn(_logger, "I/O error while reading '{}'", filepath.string());
    throw file_not_found(filename);
  }

  log_debug(_logger, "Read '{}' from disk ({} bytes)", filepath.string(), data->size());
  return data;
}

//========================================================
void file_cache::store(const std::string &filename, const content_t &content)
{
  if (content->size() > _max_bytes)
  {
    log_debug(_logger, "'{}' ({} bytes) exceeds the cache budget, not retained", filename, content->size());
    return;
  }

  const auto existing = _entries.find(filename);
  if (existing != _entries.end())
  {
    erase(existing);
  }

  _lru.push_front(filename);
  _entries.emplace(filename, entry_t{content, clock_t::now(), _lru.begin()});
  _bytes += content->size();
  evict();
}

//========================================================
void file_cache::erase(std::map<std::string, entry_t>::iterator iter)
{
  _bytes -= iter->second.content->size();
  _lru.erase(iter->second.lru_pos);
  _entries.erase(iter);
}

//========================================================
void file_cache::evict()
{
  while ((_bytes > _max_bytes) && !_lru.empty())
  {
    const auto iter = _entries.find(_lru.back());
    log_trace(_logger, "Evicting '{}' from the file cache", _lru.back());
    if (iter == _entries.end())
    {
      _lru.pop_back();
      continue;
    }
    erase(iter);
  }
}
