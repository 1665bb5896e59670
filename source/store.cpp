// source/store.cpp
#include "store_impl.hpp"
#include "caskkv/record.hpp"
#include "caskkv/util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace caskkv {

Store::Impl::Impl(const StoreOptions& o)
  : opts(o),
    dir(o.path),
    cache(o.path, o.file_limit ? o.file_limit : 64) {
  if (opts.segment_max_bytes == 0) opts.segment_max_bytes = 64ull * 1024 * 1024;
  recover();
  start_bg();
}

Store::Impl::~Impl() {
  stop_bg();
  {
    std::lock_guard wl(write_mu);
    persist_applied_locked();
    if (!active.seal()) spdlog::error("final seal failed for segment {}", active.id());
  }
  cache.close_all();
}

// ===== write path =====

bool Store::Impl::open_active_locked(uint64_t id, StoreError* err) {
  ActiveSegment seg;
  if (!seg.open(seg_path(id), id, opts.flush_mode, opts.sync_every_bytes)) {
    set_error(err, Errc::IOFailure, fmt::format("cannot open active segment {}", seg_path(id)));
    return false;
  }
  active = std::move(seg);
  cache.pin(id);
  active_seg.store(id);
  std::lock_guard sl(seg_mu);
  segs.try_emplace(id);
  return true;
}

void Store::Impl::persist_applied_locked() {
  if (last_applied == 0) return;
  if (!write_u64_file(dir, kAppliedFile, last_applied)) {
    spdlog::warn("failed to persist last applied index {}", last_applied);
  }
}

bool Store::Impl::rotate_locked(StoreError* err) {
  const uint64_t old = active.id();
  if (active.is_open() && !active.seal()) {
    spdlog::error("seal failed for segment {}, rotating anyway", old);
  }
  persist_applied_locked();
  if (old) cache.unpin(old);

  const uint64_t id = next_segment_id.fetch_add(1);
  if (!open_active_locked(id, err)) return false;
  ++rotations;
  spdlog::info("rotated segment {} -> {}", old, id);
  return true;
}

bool Store::Impl::append_locked(std::string_view key, std::string_view value, bool tombstone,
                                Location& loc, StoreError* err) {
  // предыдущая ротация не удалась или сегмент сломан откатом
  if (!active.is_open() || active.broken()) {
    if (!rotate_locked(err)) return false;
  }

  const uint64_t ts = seq;
  std::string frame;
  frame.reserve(encoded_size(key.size(), tombstone ? 0 : value.size()));
  encode_record_into(frame, key, value, ts, tombstone);

  uint64_t off = 0;
  if (!active.append(frame, off)) {
    set_error(err, Errc::IOFailure, fmt::format("append to segment {} failed", active.id()));
    return false;
  }
  ++seq;
  loc = Location{active.id(), off, static_cast<uint32_t>(frame.size()), ts, tombstone};
  bytes_appended += frame.size();
  return true;
}

bool Store::Impl::check_fenced_locked(StoreError* err) const {
  if (!fenced) return true;
  set_error(err, Errc::IOFailure, "store must be reopened to finish a snapshot import");
  return false;
}

std::optional<Location> Store::Impl::apply_locked(const Op& op, StoreError* err) {
  if (!check_fenced_locked(err)) return std::nullopt;
  if (op.key.empty() || op.key.size() > kMaxKeyBytes) {
    set_error(err, Errc::InvalidArgument, fmt::format("key size {} out of range", op.key.size()));
    return std::nullopt;
  }
  if (op.kind == OpKind::PUT && op.value.size() > kMaxValueBytes) {
    set_error(err, Errc::InvalidArgument, fmt::format("value size {} too large", op.value.size()));
    return std::nullopt;
  }

  // Повторная доставка уже применённой операции
  if (op.index != 0 && op.index <= last_applied) {
    ++duplicate_ops;
    spdlog::debug("skip duplicate op index={} (last_applied={})", op.index, last_applied);
    auto cur = index.lookup(op.key);
    if (!cur) set_error(err, Errc::NotFound, "key not found");
    return cur;
  }

  if (op.kind == OpKind::DEL) {
    auto cur = index.lookup(op.key);
    if (!cur || cur->tombstone) {
      if (op.index != 0) last_applied = op.index;
      set_error(err, Errc::NotFound, "key not found");
      return std::nullopt;
    }
  }

  Location loc;
  if (!append_locked(op.key, op.value, op.kind == OpKind::DEL, loc, err)) return std::nullopt;

  // индекс обновляется только после успешной записи
  std::optional<Location> prev;
  index.upsert(op.key, loc, &prev);
  {
    std::lock_guard sl(seg_mu);
    segs[loc.segment_id].note(loc.timestamp, loc.length);
    account_replace_locked(prev, true, loc);
  }
  if (op.index != 0) last_applied = op.index;
  if (op.kind == OpKind::PUT) ++puts; else ++dels;

  if (active.size() > opts.segment_max_bytes) {
    StoreError re;
    if (!rotate_locked(&re)) spdlog::error("rotation failed: {}", re.message);
  }
  return loc;
}

void Store::Impl::after_rotation() {
  if (opts.merge.trigger == MergeTrigger::MANUAL) return;
  if (opts.merge.background) {
    {
      std::lock_guard lk(bg_mu);
      need_merge = true;
    }
    bg_cv.notify_one();
    return;
  }
  if (!merge_due()) return;
  StoreError e;
  if (!merge_once(false, nullptr, &e)) spdlog::warn("merge failed: {}", e.message);
}

// ===== read path =====

std::optional<std::string> Store::Impl::read_value(std::string_view key, StoreError* err) {
  // Повтор только если ключ переехал (слияние между lookup и acquire)
  for (int attempt = 0; attempt < 3; ++attempt) {
    auto loc = index.lookup(key);
    if (!loc || loc->tombstone) {
      set_error(err, Errc::NotFound, "key not found");
      return std::nullopt;
    }

    StoreError e;
    std::string frame;
    auto lease = cache.acquire(loc->segment_id, &e);
    bool ok = lease && read_frame_at(lease.fd(), loc->offset, loc->length, frame);
    lease.release();
    if (!ok) {
      if (index.lookup(key) != loc) continue;
      if (e.code == Errc::Ok) {
        e = StoreError{Errc::IOFailure,
                       fmt::format("read of segment {} at {} failed", loc->segment_id, loc->offset)};
      }
      set_error(err, e.code, e.message);
      return std::nullopt;
    }

    Record rec;
    if (decode_record(frame, rec) != DecodeStatus::Ok || rec.key != key || rec.tombstone) {
      spdlog::error("corrupt record in segment {} at offset {}", loc->segment_id, loc->offset);
      set_error(err, Errc::CorruptRecord,
                fmt::format("corrupt record in segment {} at offset {}", loc->segment_id, loc->offset));
      return std::nullopt;
    }
    return std::move(rec.value);
  }
  set_error(err, Errc::IOFailure, "key relocated concurrently, giving up");
  return std::nullopt;
}

// ===== snapshot =====

bool Store::Impl::export_locked(Snapshot& out, StoreError* err) {
  std::vector<std::pair<std::string, Location>> items;
  {
    std::lock_guard wl(write_mu);
    out.last_applied = last_applied;
    index.for_each([&](const std::string& k, const Location& loc) {
      if (!loc.tombstone) items.emplace_back(k, loc);
    });
  }
  std::sort(items.begin(), items.end(),
            [](const auto& a, const auto& b){ return a.first < b.first; });

  // сегменты не исчезнут: слияние и импорт исключены merge_mu
  out.entries.clear();
  out.entries.reserve(items.size());
  std::string frame;
  Record rec;
  for (const auto& [key, loc] : items) {
    auto lease = cache.acquire(loc.segment_id, err);
    if (!lease) return false;
    if (!read_frame_at(lease.fd(), loc.offset, loc.length, frame)) {
      set_error(err, Errc::IOFailure, fmt::format("snapshot read of segment {} failed", loc.segment_id));
      return false;
    }
    if (decode_record(frame, rec) != DecodeStatus::Ok || rec.key != key) {
      set_error(err, Errc::CorruptRecord,
                fmt::format("corrupt record in segment {} at offset {}", loc.segment_id, loc.offset));
      return false;
    }
    out.entries.push_back({key, std::move(rec.value)});
  }
  spdlog::info("snapshot exported: {} keys, last_applied={}", out.entries.size(), out.last_applied);
  return true;
}

bool Store::Impl::import_locked(const Snapshot& snap, StoreError* err) {
  std::lock_guard wl(write_mu);
  if (!check_fenced_locked(err)) return false;

  const uint64_t first = next_segment_id.load();
  std::vector<uint64_t> staged;
  std::vector<std::pair<const std::string*, Location>> locs;
  std::map<uint64_t, SegmentInfo> fresh;
  uint64_t ts = seq;
  ActiveSegment out;

  auto fail = [&](Errc code, std::string msg) {
    (void)out.seal();
    for (uint64_t id : staged) {
      (void)::unlink(join_path(dir, segment_temp_name(id, kImportSuffix)).c_str());
    }
    spdlog::error("snapshot import failed: {}", msg);
    set_error(err, code, std::move(msg));
    return false;
  };

  // 1. пишем всё во временные сегменты
  locs.reserve(snap.entries.size());
  for (const auto& kv : snap.entries) {
    if (kv.key.empty() || kv.key.size() > kMaxKeyBytes || kv.value.size() > kMaxValueBytes) {
      return fail(Errc::InvalidArgument, "snapshot entry out of range");
    }
    if (!out.is_open() || out.size() > opts.segment_max_bytes) {
      if (out.is_open() && !out.seal()) return fail(Errc::IOFailure, "seal of staged segment failed");
      const uint64_t id = next_segment_id.fetch_add(1);
      staged.push_back(id);
      if (!out.open(join_path(dir, segment_temp_name(id, kImportSuffix)), id, FlushMode::NONE, 0)) {
        return fail(Errc::IOFailure, fmt::format("cannot create staged segment {}", id));
      }
      fresh.try_emplace(id);
    }
    std::string frame;
    encode_record_into(frame, kv.key, kv.value, ts, false);
    uint64_t off = 0;
    if (!out.append(frame, off)) return fail(Errc::IOFailure, "staged append failed");
    const Location loc{out.id(), off, static_cast<uint32_t>(frame.size()), ts, false};
    fresh[loc.segment_id].note(ts, loc.length);
    locs.emplace_back(&kv.key, loc);
    ++ts;
  }
  if (out.is_open() && !out.seal()) return fail(Errc::IOFailure, "seal of staged segment failed");

  // 2. точка коммита
  std::string marker;
  put_u64(marker, first);
  put_u64(marker, snap.last_applied);
  if (!write_file_atomic(dir, kImportMarker, marker)) {
    return fail(Errc::IOFailure, "cannot write IMPORT marker");
  }

  // 3. переименование; при сбое импорт доведёт recovery, до переоткрытия запись запрещена
  for (uint64_t id : staged) {
    const auto from = join_path(dir, segment_temp_name(id, kImportSuffix));
    if (::rename(from.c_str(), seg_path(id).c_str()) != 0) {
      spdlog::error("import promote of {} failed: {} (store is read-only until reopened)",
                    from, std::strerror(errno));
      fenced = true;
      set_error(err, Errc::IOFailure, "import committed but not promoted");
      return false;
    }
  }
  fsync_dir_path(dir);

  // 4. новое состояние в памяти: сначала новые адреса, потом удаление старых ключей
  const uint64_t old_active = active.id();
  if (!active.seal()) spdlog::warn("seal of segment {} failed during import", old_active);
  cache.unpin(old_active);

  {
    std::lock_guard sl(seg_mu);
    segs = std::move(fresh);
  }
  std::optional<Location> prev;
  for (const auto& [key, loc] : locs) {
    index.upsert(*key, loc, &prev);
    if (prev && prev->segment_id >= first) {
      // дубликат ключа внутри снапшота
      std::lock_guard sl(seg_mu);
      segs[prev->segment_id].dead_bytes += prev->length;
    }
  }
  std::vector<std::pair<std::string, Location>> stale;
  index.for_each([&](const std::string& k, const Location& loc) {
    if (loc.segment_id < first) stale.emplace_back(k, loc);
  });
  for (const auto& [k, loc] : stale) (void)index.remove_if(k, loc);

  seq = ts;
  last_applied = snap.last_applied;
  if (!write_u64_file(dir, kAppliedFile, last_applied)) {
    spdlog::warn("failed to persist last applied index {}", last_applied);
  }

  StoreError oe;
  if (!open_active_locked(next_segment_id.fetch_add(1), &oe)) {
    spdlog::error("import: {}", oe.message);
  }
  // Все старые файлы (и ждущие читателей после слияний) удаляются до снятия маркера;
  // открытые дескрипторы дочитают.
  for (uint64_t id : list_segments_sorted(dir)) {
    if (id < first) cache.retire(id, false);
  }
  fsync_dir_path(dir);

  (void)::unlink(join_path(dir, kImportMarker).c_str());
  fsync_dir_path(dir);

  spdlog::info("snapshot imported: {} keys into {} segments, last_applied={}",
               locs.size(), staged.size(), last_applied);
  return true;
}

// ===== Store API =====

Store::Store(const StoreOptions& opts) : p_(new Impl(opts)) {}

Store::~Store() {
  delete p_;
  p_ = nullptr;
}

std::optional<Location> Store::apply(const Op& op, StoreError* err) {
  std::optional<Location> res;
  bool rotated = false;
  {
    std::lock_guard wl(p_->write_mu);
    const uint64_t before = p_->rotations.load();
    res = p_->apply_locked(op, err);
    rotated = p_->rotations.load() != before;
  }
  // слияние только вне write_mu
  if (rotated) p_->after_rotation();
  return res;
}

bool Store::put(std::string_view key, std::string_view value, StoreError* err) {
  return apply(Op::put(std::string(key), std::string(value)), err).has_value();
}

bool Store::del(std::string_view key, StoreError* err) {
  return apply(Op::del(std::string(key)), err).has_value();
}

std::optional<std::string> Store::get(std::string_view key, StoreError* err) {
  ++p_->gets;
  auto v = p_->read_value(key, err);
  if (v) ++p_->get_hits; else ++p_->get_misses;
  return v;
}

std::optional<Location> Store::locate(std::string_view key) const {
  return p_->index.lookup(key);
}

std::vector<std::string> Store::list_keys() const {
  std::vector<std::string> out;
  p_->index.for_each([&](const std::string& k, const Location& loc) {
    if (!loc.tombstone) out.push_back(k);
  });
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<Snapshot> Store::snapshot_export(StoreError* err) {
  std::lock_guard ml(p_->merge_mu);
  Snapshot snap;
  if (!p_->export_locked(snap, err)) return std::nullopt;
  return snap;
}

bool Store::snapshot_import(const Snapshot& snap, StoreError* err) {
  std::lock_guard ml(p_->merge_mu);
  return p_->import_locked(snap, err);
}

bool Store::merge(MergeReport* report, StoreError* err) {
  return p_->merge_once(true, report, err);
}

bool Store::sync(StoreError* err) {
  std::lock_guard wl(p_->write_mu);
  if (!p_->active.sync()) {
    set_error(err, Errc::IOFailure, fmt::format("sync of segment {} failed", p_->active.id()));
    return false;
  }
  p_->persist_applied_locked();
  return true;
}

StoreMetrics Store::get_metrics() const {
  StoreMetrics m;
  m.puts = p_->puts.load();
  m.dels = p_->dels.load();
  m.gets = p_->gets.load();
  m.get_hits = p_->get_hits.load();
  m.get_misses = p_->get_misses.load();
  m.duplicate_ops = p_->duplicate_ops.load();
  m.bytes_appended = p_->bytes_appended.load();
  m.rotations = p_->rotations.load();
  m.merges = p_->merges.load();
  m.merge_bytes_reclaimed = p_->merge_bytes_reclaimed.load();
  m.tombstones_purged = p_->tombstones_purged.load();

  m.cache_hits = p_->cache.hits();
  m.cache_misses = p_->cache.misses();
  m.cache_opens = p_->cache.opens();
  m.cache_evictions = p_->cache.evictions();
  m.cache_over_limit = p_->cache.over_limit();
  m.cache_open_handles = p_->cache.open_count();

  {
    std::lock_guard sl(p_->seg_mu);
    m.segment_count = p_->segs.size();
    for (const auto& [id, info] : p_->segs) m.segment_bytes += info.bytes;
  }
  m.key_count = p_->index.live_size();
  m.active_segment_id = p_->active_seg.load();
  m.last_applied = last_applied_index();
  return m;
}

void Store::reset_metrics(bool reset_cache_stats) {
  p_->puts = 0; p_->dels = 0; p_->gets = 0;
  p_->get_hits = 0; p_->get_misses = 0; p_->duplicate_ops = 0;
  p_->bytes_appended = 0; p_->rotations = 0; p_->merges = 0;
  p_->merge_bytes_reclaimed = 0; p_->tombstones_purged = 0;
  if (reset_cache_stats) p_->cache.reset_stats();
}

std::vector<SegmentStat> Store::segment_stats() const {
  std::vector<SegmentStat> out;
  const uint64_t act = p_->active_seg.load();
  std::lock_guard sl(p_->seg_mu);
  for (const auto& [id, info] : p_->segs) {
    out.push_back(SegmentStat{id, info.bytes, info.dead_bytes, id == act, info.merged});
  }
  return out;
}

uint64_t Store::total_segment_bytes() const {
  std::lock_guard sl(p_->seg_mu);
  uint64_t total = 0;
  for (const auto& [id, info] : p_->segs) total += info.bytes;
  return total;
}

uint64_t Store::active_segment_id() const { return p_->active_seg.load(); }

uint64_t Store::active_segment_size() const {
  std::lock_guard wl(p_->write_mu);
  return p_->active.size();
}

uint64_t Store::last_applied_index() const {
  std::lock_guard wl(p_->write_mu);
  return p_->last_applied;
}

const StoreOptions& Store::options() const { return p_->opts; }

} // namespace caskkv
