// source/key_index.cpp
#include "caskkv/key_index.hpp"

#include <mutex>

namespace caskkv {

KeyIndex::Shard& KeyIndex::shard_for(std::string_view key) {
  return shards_[std::hash<std::string_view>{}(key) % kShards];
}

const KeyIndex::Shard& KeyIndex::shard_for(std::string_view key) const {
  return shards_[std::hash<std::string_view>{}(key) % kShards];
}

void KeyIndex::upsert(std::string_view key, const Location& loc, std::optional<Location>* prev) {
  auto& sh = shard_for(key);
  std::unique_lock lk(sh.mu);
  auto [it, inserted] = sh.map.try_emplace(std::string(key), loc);
  if (!inserted) {
    if (prev) *prev = it->second;
    it->second = loc;
  } else if (prev) {
    prev->reset();
  }
}

bool KeyIndex::upsert_if_newer(std::string_view key, const Location& loc, std::optional<Location>* prev) {
  auto& sh = shard_for(key);
  std::unique_lock lk(sh.mu);
  auto it = sh.map.find(std::string(key));
  if (it == sh.map.end()) {
    sh.map.emplace(std::string(key), loc);
    if (prev) prev->reset();
    return true;
  }
  if (loc.timestamp < it->second.timestamp) return false;
  if (prev) *prev = it->second;
  it->second = loc;
  return true;
}

std::optional<Location> KeyIndex::lookup(std::string_view key) const {
  const auto& sh = shard_for(key);
  std::shared_lock lk(sh.mu);
  auto it = sh.map.find(std::string(key));
  if (it == sh.map.end()) return std::nullopt;
  return it->second;
}

bool KeyIndex::compare_and_swap(std::string_view key, const Location& expected, const Location& desired) {
  auto& sh = shard_for(key);
  std::unique_lock lk(sh.mu);
  auto it = sh.map.find(std::string(key));
  if (it == sh.map.end() || !(it->second == expected)) return false;
  it->second = desired;
  return true;
}

bool KeyIndex::remove_if(std::string_view key, const Location& expected) {
  auto& sh = shard_for(key);
  std::unique_lock lk(sh.mu);
  auto it = sh.map.find(std::string(key));
  if (it == sh.map.end() || !(it->second == expected)) return false;
  sh.map.erase(it);
  return true;
}

void KeyIndex::for_each(const std::function<void(const std::string&, const Location&)>& fn) const {
  for (const auto& sh : shards_) {
    std::shared_lock lk(sh.mu);
    for (const auto& [k, loc] : sh.map) fn(k, loc);
  }
}

size_t KeyIndex::size() const {
  size_t n = 0;
  for (const auto& sh : shards_) {
    std::shared_lock lk(sh.mu);
    n += sh.map.size();
  }
  return n;
}

size_t KeyIndex::live_size() const {
  size_t n = 0;
  for (const auto& sh : shards_) {
    std::shared_lock lk(sh.mu);
    for (const auto& kv : sh.map)
      if (!kv.second.tombstone) ++n;
  }
  return n;
}

void KeyIndex::clear() {
  for (auto& sh : shards_) {
    std::unique_lock lk(sh.mu);
    sh.map.clear();
  }
}

} // namespace caskkv
