// source/store_impl.hpp
#pragma once
#include "caskkv/handle_cache.hpp"
#include "caskkv/key_index.hpp"
#include "caskkv/segment.hpp"
#include "caskkv/store.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace caskkv {

static constexpr const char* kAppliedFile = "APPLIED";
static constexpr const char* kImportMarker = "IMPORT";
static constexpr std::string_view kMergeSuffix = ".merge";
static constexpr std::string_view kImportSuffix = ".import";

// Учёт по сегменту для выбора кандидатов на слияние
struct SegmentInfo {
  uint64_t bytes = 0;
  uint64_t dead_bytes = 0;
  uint64_t min_ts = UINT64_MAX;
  uint64_t max_ts = 0;
  bool     merged = false; // выход слияния (tombstone из него можно вычищать)

  void note(uint64_t ts, uint64_t len) {
    bytes += len;
    if (ts < min_ts) min_ts = ts;
    if (ts > max_ts) max_ts = ts;
  }
};

// Порядок захвата: merge_mu -> write_mu -> seg_mu; шарды индекса и кэш листовые.
struct Store::Impl {
  StoreOptions opts;
  std::string  dir;

  KeyIndex    index;
  HandleCache cache;

  // Путь записи: один писатель
  mutable std::mutex write_mu;
  ActiveSegment active;
  uint64_t      seq = 1;          // логическое время следующей записи
  uint64_t      last_applied = 0; // номер последней применённой операции
  bool          fenced = false;   // импорт закоммичен, но не доведён: до переоткрытия только чтение

  // Сегменты и их учёт
  mutable std::mutex              seg_mu;
  std::map<uint64_t, SegmentInfo> segs;
  std::atomic<uint64_t>           next_segment_id{1};
  std::atomic<uint64_t>           active_seg{0};

  // Одно слияние / экспорт / импорт за раз
  std::mutex merge_mu;

  // Фоновое слияние
  std::thread             bg_merger;
  std::mutex              bg_mu;
  std::condition_variable bg_cv;
  bool                    need_merge = false;
  bool                    stopping = false;
  std::atomic<bool>       stop_requested{false};

  // Метрики
  std::atomic<uint64_t> puts{0}, dels{0}, gets{0}, get_hits{0}, get_misses{0}, duplicate_ops{0};
  std::atomic<uint64_t> bytes_appended{0}, rotations{0}, merges{0};
  std::atomic<uint64_t> merge_bytes_reclaimed{0}, tombstones_purged{0};

  explicit Impl(const StoreOptions& o);
  ~Impl();

  std::string seg_path(uint64_t id) const { return dir + "/" + segment_name(id); }

  // ---- recovery.cpp ----
  void recover();
  void finish_pending_import();
  void remove_provisional_files();
  void replay_segment(uint64_t id, bool is_last, uint64_t& max_ts);
  void account_replace_locked(const std::optional<Location>& prev, bool replaced,
                              const Location& loc);

  // ---- store.cpp ----
  bool check_fenced_locked(StoreError* err) const;
  std::optional<Location> apply_locked(const Op& op, StoreError* err);
  bool append_locked(std::string_view key, std::string_view value, bool tombstone,
                     Location& loc, StoreError* err);
  bool rotate_locked(StoreError* err);
  bool open_active_locked(uint64_t id, StoreError* err);
  void persist_applied_locked();
  void after_rotation(); // фоновое или синхронное слияние по политике
  std::optional<std::string> read_value(std::string_view key, StoreError* err);

  bool export_locked(Snapshot& out, StoreError* err);
  bool import_locked(const Snapshot& snap, StoreError* err);

  // ---- compactor.cpp ----
  bool merge_due() const;
  std::vector<uint64_t> select_batch_locked(bool forced, uint64_t& min_outside_ts) const;
  bool merge_once(bool forced, MergeReport* report, StoreError* err);
  void merger_thread();
  void start_bg();
  void stop_bg();
};

} // namespace caskkv
