#include "ChunkCache.hpp"

namespace rdg {

ChunkCache::ChunkCache(size_t capacityBytes) : capacity_(capacityBytes) {}

std::shared_ptr<const std::string> ChunkCache::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it == index_.end()) return nullptr;
  lru_.splice(lru_.begin(), lru_, it->second);
  return it->second->second;
}

void ChunkCache::put(const std::string& key, std::shared_ptr<const std::string> bytes) {
  if (!bytes || bytes->size() > capacity_) return;
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it != index_.end()) {
    used_ -= it->second->second->size();
    lru_.erase(it->second);
    index_.erase(it);
  }
  used_ += bytes->size();
  lru_.emplace_front(key, std::move(bytes));
  index_[key] = lru_.begin();
  evictLocked();
}

void ChunkCache::erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it == index_.end()) return;
  used_ -= it->second->second->size();
  lru_.erase(it->second);
  index_.erase(it);
}

size_t ChunkCache::sizeBytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return used_;
}

void ChunkCache::evictLocked() {
  while (used_ > capacity_ && !lru_.empty()) {
    used_ -= lru_.back().second->size();
    index_.erase(lru_.back().first);
    lru_.pop_back();
  }
}

} // namespace rdg
