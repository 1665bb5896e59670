// include/caskkv/handle_cache.hpp
#pragma once
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "caskkv/error.hpp"

namespace caskkv {

// LRU-кэш read-дескрипторов сегментов со счётчиком ссылок.
// Дескриптор с незавершённым чтением (refs > 0) не закрывается никогда;
// если все открытые заняты, лимит временно превышается.
class HandleCache {
public:
  class Lease {
  public:
    Lease() = default;
    ~Lease() { release(); }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& o) noexcept : cache_(o.cache_), id_(o.id_), fd_(o.fd_) {
      o.cache_ = nullptr; o.fd_ = -1;
    }
    Lease& operator=(Lease&& o) noexcept {
      if (this != &o) {
        release();
        cache_ = o.cache_; id_ = o.id_; fd_ = o.fd_;
        o.cache_ = nullptr; o.fd_ = -1;
      }
      return *this;
    }

    int      fd() const { return fd_; }
    uint64_t segment_id() const { return id_; }
    explicit operator bool() const { return cache_ != nullptr && fd_ >= 0; }

    void release() {
      if (cache_) cache_->release(id_);
      cache_ = nullptr;
      fd_ = -1;
    }

  private:
    friend class HandleCache;
    Lease(HandleCache* c, uint64_t id, int fd) : cache_(c), id_(id), fd_(fd) {}

    HandleCache* cache_ = nullptr;
    uint64_t     id_ = 0;
    int          fd_ = -1;
  };

  HandleCache(std::string dir, size_t file_limit);
  ~HandleCache();

  HandleCache(const HandleCache&) = delete;
  HandleCache& operator=(const HandleCache&) = delete;

  // Пустой Lease + err при ошибке открытия
  Lease acquire(uint64_t segment_id, StoreError* err = nullptr);

  // Активный сегмент не вытесняется, пока закреплён
  void pin(uint64_t segment_id);
  void unpin(uint64_t segment_id);

  // Удалить файл сегмента (и его hint), как только уйдут все читатели.
  // defer=false: файл удаляется сразу, открытые дескрипторы дочитывают его.
  void retire(uint64_t segment_id, bool defer = true);

  void close_all();

  size_t   limit() const { return cap_; }
  size_t   open_count() const;
  uint32_t in_flight(uint64_t segment_id) const;
  bool     is_open(uint64_t segment_id) const;
  size_t   retired_pending() const; // удаление ждёт читателей

  uint64_t hits() const;
  uint64_t misses() const;
  uint64_t opens() const;
  uint64_t evictions() const;
  uint64_t over_limit() const;
  void reset_stats();

private:
  struct Node {
    uint64_t id;
    int      fd;
    uint32_t refs;
  };

  void release(uint64_t segment_id);
  void evict_locked(std::vector<int>& to_close);
  void erase_locked(std::unordered_map<uint64_t, std::list<Node>::iterator>::iterator it,
                    std::vector<int>& to_close);
  static void close_fds(const std::vector<int>& fds);
  void unlink_segment(uint64_t segment_id) const;

  std::string dir_;
  size_t      cap_;

  mutable std::mutex mu_;
  std::list<Node> lru_;
  std::unordered_map<uint64_t, std::list<Node>::iterator> map_;
  std::unordered_set<uint64_t> pinned_;
  std::unordered_set<uint64_t> retired_;  // ждут последнего release
  std::unordered_set<uint64_t> detached_; // файл уже удалён
  std::unordered_set<uint64_t> gone_;     // все удалённые сегменты

  uint64_t hits_ = 0, misses_ = 0, opens_ = 0, evictions_ = 0, over_limit_ = 0;
};

} // namespace caskkv
