#pragma once
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rdg {

// LRU of verified chunk bytes, bounded by total payload size.
class ChunkCache {
public:
  explicit ChunkCache(size_t capacityBytes);

  std::shared_ptr<const std::string> get(const std::string& key);
  void put(const std::string& key, std::shared_ptr<const std::string> bytes);
  void erase(const std::string& key);

  size_t sizeBytes() const;
  size_t capacityBytes() const { return capacity_; }

private:
  using Entry = std::pair<std::string, std::shared_ptr<const std::string>>;

  void evictLocked();

  mutable std::mutex mu_;
  std::list<Entry> lru_;   // front = most recent
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  size_t used_ = 0;
  size_t capacity_;
};

} // namespace rdg
