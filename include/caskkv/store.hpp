// include/caskkv/store.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "caskkv/error.hpp"
#include "caskkv/key_index.hpp"
#include "caskkv/segment.hpp"
#include "caskkv/snapshot.hpp"

namespace caskkv {

// Когда запускать слияние и какие сегменты брать
enum class MergeTrigger : uint8_t {
  MANUAL,       // только по явному merge()
  DEAD_RATIO,   // сегменты с долей мёртвых байт >= dead_ratio
  SEALED_COUNT  // все закрытые сегменты, когда их >= min_sealed_segments
};

struct MergePolicy {
  MergeTrigger trigger = MergeTrigger::MANUAL;
  double       dead_ratio = 0.5;
  size_t       min_sealed_segments = 4;
  bool         background = false;
  uint32_t     interval_ms = 1000;
  bool         write_hints = true;
};

struct StoreOptions {
  std::string path = "./cask";

  // Кэш read-дескрипторов
  size_t file_limit = 64;

  // Ротация активного сегмента
  uint64_t segment_max_bytes = 64ull * 1024 * 1024;

  // Долговечность: fsync после каждых sync_every_bytes (0: после каждой записи)
  FlushMode flush_mode = FlushMode::FDATASYNC;
  uint64_t  sync_every_bytes = (1ull << 20);

  MergePolicy merge{};
};

enum class OpKind : uint8_t { PUT, DEL };

// Зафиксированная операция от слоя репликации; index: номер в журнале, 0 если без номера
struct Op {
  OpKind      kind = OpKind::PUT;
  std::string key;
  std::string value;
  uint64_t    index = 0;

  static Op put(std::string k, std::string v, uint64_t idx = 0) {
    return Op{OpKind::PUT, std::move(k), std::move(v), idx};
  }
  static Op del(std::string k, uint64_t idx = 0) {
    return Op{OpKind::DEL, std::move(k), std::string{}, idx};
  }
};

struct SegmentStat {
  uint64_t id = 0;
  uint64_t bytes = 0;
  uint64_t dead_bytes = 0;
  bool     active = false;
  bool     merged = false;
};

struct MergeReport {
  size_t   segments_in = 0;
  size_t   segments_out = 0;
  uint64_t bytes_in = 0;
  uint64_t bytes_out = 0;
  uint64_t records_kept = 0;
  uint64_t records_dropped = 0;
  uint64_t tombstones_purged = 0;
  bool     interrupted = false;
};

// Плоский снимок метрик
struct StoreMetrics {
  uint64_t puts = 0;
  uint64_t dels = 0;
  uint64_t gets = 0;
  uint64_t get_hits = 0;
  uint64_t get_misses = 0;
  uint64_t duplicate_ops = 0;

  uint64_t bytes_appended = 0;
  uint64_t rotations = 0;
  uint64_t merges = 0;
  uint64_t merge_bytes_reclaimed = 0;
  uint64_t tombstones_purged = 0;

  uint64_t cache_hits = 0;
  uint64_t cache_misses = 0;
  uint64_t cache_opens = 0;
  uint64_t cache_evictions = 0;
  uint64_t cache_over_limit = 0;
  uint64_t cache_open_handles = 0;

  uint64_t segment_count = 0;
  uint64_t segment_bytes = 0;
  uint64_t key_count = 0;
  uint64_t active_segment_id = 0;
  uint64_t last_applied = 0;
};

class Store {
public:
  // Бросает StorageFault, если восстановление невозможно
  explicit Store(const StoreOptions& opts);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  // Применение зафиксированной операции (строго по порядку коммита)
  std::optional<Location> apply(const Op& op, StoreError* err = nullptr);

  bool put(std::string_view key, std::string_view value, StoreError* err = nullptr);
  // false + NotFound, если ключа не было
  bool del(std::string_view key, StoreError* err = nullptr);
  std::optional<std::string> get(std::string_view key, StoreError* err = nullptr);
  std::optional<Location> locate(std::string_view key) const;
  std::vector<std::string> list_keys() const;

  std::optional<Snapshot> snapshot_export(StoreError* err = nullptr);
  bool snapshot_import(const Snapshot& snap, StoreError* err = nullptr);

  // Слияние всех закрытых сегментов
  bool merge(MergeReport* report = nullptr, StoreError* err = nullptr);

  bool sync(StoreError* err = nullptr);

  StoreMetrics get_metrics() const;
  void reset_metrics(bool reset_cache_stats);

  std::vector<SegmentStat> segment_stats() const;
  uint64_t total_segment_bytes() const;
  uint64_t active_segment_id() const;
  uint64_t active_segment_size() const;
  uint64_t last_applied_index() const;
  const StoreOptions& options() const;

  struct Impl;

private:
  Impl *p_;
};

} // namespace caskkv
