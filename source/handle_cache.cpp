// source/handle_cache.cpp
#include "caskkv/handle_cache.hpp"
#include "caskkv/segment.hpp"
#include "caskkv/util.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace caskkv {

HandleCache::HandleCache(std::string dir, size_t file_limit)
    : dir_(std::move(dir)), cap_(file_limit ? file_limit : 1) {}

HandleCache::~HandleCache() { close_all(); }

void HandleCache::close_fds(const std::vector<int>& fds) {
  for (int fd : fds) ::close(fd);
}

void HandleCache::unlink_segment(uint64_t segment_id) const {
  const auto seg = join_path(dir_, segment_name(segment_id));
  if (::unlink(seg.c_str()) != 0 && errno != ENOENT) {
    spdlog::warn("unlink failed: {}: {}", seg, std::strerror(errno));
  }
  const auto hint = join_path(dir_, hint_name(segment_id));
  (void)::unlink(hint.c_str());
  spdlog::debug("segment {} removed", segment_id);
}

void HandleCache::erase_locked(std::unordered_map<uint64_t, std::list<Node>::iterator>::iterator it,
                               std::vector<int>& to_close) {
  to_close.push_back(it->second->fd);
  lru_.erase(it->second);
  map_.erase(it);
}

// Вытесняем с хвоста LRU только свободные и незакреплённые дескрипторы.
void HandleCache::evict_locked(std::vector<int>& to_close) {
  auto it = lru_.end();
  while (lru_.size() > cap_ && it != lru_.begin()) {
    --it;
    if (it->refs == 0 && pinned_.count(it->id) == 0) {
      to_close.push_back(it->fd);
      map_.erase(it->id);
      it = lru_.erase(it);
      ++evictions_;
    }
  }
  if (lru_.size() > cap_) {
    ++over_limit_;
    spdlog::debug("handle cache over limit: open={} limit={} ({})", lru_.size(), cap_,
                  errc_name(Errc::CapacityTransientExceeded));
  }
}

HandleCache::Lease HandleCache::acquire(uint64_t segment_id, StoreError* err) {
  {
    std::lock_guard lk(mu_);
    auto it = map_.find(segment_id);
    if (it != map_.end()) {
      ++hits_;
      it->second->refs++;
      lru_.splice(lru_.begin(), lru_, it->second);
      return Lease(this, segment_id, it->second->fd);
    }
    ++misses_;
  }

  // open вне лока
  const auto path = join_path(dir_, segment_name(segment_id));
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    set_error(err, Errc::IOFailure, "open " + path + ": " + std::strerror(errno));
    return Lease{};
  }

  std::vector<int> to_close;
  int use_fd = fd;
  {
    std::lock_guard lk(mu_);
    auto it = map_.find(segment_id);
    if (it != map_.end()) {
      // кто-то успел открыть параллельно
      to_close.push_back(fd);
      use_fd = it->second->fd;
      it->second->refs++;
      lru_.splice(lru_.begin(), lru_, it->second);
    } else {
      ++opens_;
      lru_.push_front(Node{segment_id, fd, 1});
      map_[segment_id] = lru_.begin();
      // retire успел удалить файл между open и вставкой
      if (gone_.count(segment_id)) detached_.insert(segment_id);
      evict_locked(to_close);
    }
  }
  close_fds(to_close);
  return Lease(this, segment_id, use_fd);
}

void HandleCache::release(uint64_t segment_id) {
  std::vector<int> to_close;
  bool drop_file = false;
  {
    std::lock_guard lk(mu_);
    auto it = map_.find(segment_id);
    if (it == map_.end()) return;
    if (it->second->refs > 0) it->second->refs--;
    if (it->second->refs == 0) {
      if (retired_.count(segment_id)) {
        erase_locked(it, to_close);
        retired_.erase(segment_id);
        gone_.insert(segment_id);
        drop_file = true;
      } else if (detached_.count(segment_id)) {
        erase_locked(it, to_close);
        detached_.erase(segment_id);
      } else if (lru_.size() > cap_) {
        evict_locked(to_close);
      }
    }
  }
  close_fds(to_close);
  if (drop_file) unlink_segment(segment_id);
}

void HandleCache::pin(uint64_t segment_id) {
  std::lock_guard lk(mu_);
  pinned_.insert(segment_id);
}

void HandleCache::unpin(uint64_t segment_id) {
  std::vector<int> to_close;
  {
    std::lock_guard lk(mu_);
    pinned_.erase(segment_id);
    evict_locked(to_close);
  }
  close_fds(to_close);
}

void HandleCache::retire(uint64_t segment_id, bool defer) {
  std::vector<int> to_close;
  bool drop_now = true;
  {
    std::lock_guard lk(mu_);
    pinned_.erase(segment_id);
    auto it = map_.find(segment_id);
    if (it != map_.end()) {
      if (it->second->refs == 0) {
        erase_locked(it, to_close);
      } else if (defer) {
        // удаление откладывается до последнего release
        retired_.insert(segment_id);
        drop_now = false;
      } else {
        retired_.erase(segment_id);
        detached_.insert(segment_id);
      }
    }
    if (drop_now) gone_.insert(segment_id);
  }
  close_fds(to_close);
  if (drop_now) unlink_segment(segment_id);
}

void HandleCache::close_all() {
  std::vector<int> to_close;
  std::vector<uint64_t> pending;
  {
    std::lock_guard lk(mu_);
    for (auto& n : lru_) to_close.push_back(n.fd);
    lru_.clear();
    map_.clear();
    pending.assign(retired_.begin(), retired_.end());
    retired_.clear();
    detached_.clear();
  }
  close_fds(to_close);
  for (auto id : pending) unlink_segment(id);
}

size_t HandleCache::open_count() const {
  std::lock_guard lk(mu_);
  return lru_.size();
}

uint32_t HandleCache::in_flight(uint64_t segment_id) const {
  std::lock_guard lk(mu_);
  auto it = map_.find(segment_id);
  return it == map_.end() ? 0 : it->second->refs;
}

bool HandleCache::is_open(uint64_t segment_id) const {
  std::lock_guard lk(mu_);
  return map_.count(segment_id) != 0;
}

size_t HandleCache::retired_pending() const {
  std::lock_guard lk(mu_);
  return retired_.size();
}

uint64_t HandleCache::hits() const       { std::lock_guard lk(mu_); return hits_; }
uint64_t HandleCache::misses() const     { std::lock_guard lk(mu_); return misses_; }
uint64_t HandleCache::opens() const      { std::lock_guard lk(mu_); return opens_; }
uint64_t HandleCache::evictions() const  { std::lock_guard lk(mu_); return evictions_; }
uint64_t HandleCache::over_limit() const { std::lock_guard lk(mu_); return over_limit_; }

void HandleCache::reset_stats() {
  std::lock_guard lk(mu_);
  hits_ = misses_ = opens_ = evictions_ = over_limit_ = 0;
}

} // namespace caskkv
