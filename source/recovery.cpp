// source/recovery.cpp
#include "store_impl.hpp"
#include "caskkv/hint.hpp"
#include "caskkv/util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <set>
#include <unistd.h>

namespace caskkv {

namespace {

bool ends_with(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// Импорт снапшота прерван: маркер IMPORT является точкой коммита.
// Есть маркер -> доводим импорт до конца; нет -> staged-файлы просто мусор.
void Store::Impl::finish_pending_import() {
  std::string body;
  if (!read_small_file(join_path(dir, kImportMarker), body)) return;
  if (body.size() != 16) {
    throw StorageFault(Errc::CorruptRecord, "malformed IMPORT marker in " + dir);
  }
  const uint64_t first = get_u64(body.data());
  const uint64_t applied = get_u64(body.data() + 8);
  spdlog::warn("completing interrupted snapshot import (first segment {})", first);

  for (uint64_t id : list_segments_sorted(dir, ".cask.import")) {
    const auto from = join_path(dir, segment_temp_name(id, kImportSuffix));
    if (id < first) { (void)::unlink(from.c_str()); continue; }
    if (::rename(from.c_str(), seg_path(id).c_str()) != 0) {
      throw StorageFault(Errc::IOFailure,
                         fmt::format("cannot promote {}: {}", from, std::strerror(errno)));
    }
  }
  for (uint64_t id : list_segments_sorted(dir)) {
    if (id >= first) continue;
    (void)::unlink(seg_path(id).c_str());
    (void)::unlink(join_path(dir, hint_name(id)).c_str());
  }
  fsync_dir_path(dir);

  if (!write_u64_file(dir, kAppliedFile, applied)) {
    throw StorageFault(Errc::IOFailure, "cannot write " + std::string(kAppliedFile));
  }
  (void)::unlink(join_path(dir, kImportMarker).c_str());
  fsync_dir_path(dir);
}

// Недописанные выходы слияния/импорта и .tmp никем не адресуются
void Store::Impl::remove_provisional_files() {
  std::vector<std::string> garbage;
  if (DIR* d = ::opendir(dir.c_str())) {
    while (auto* e = ::readdir(d)) {
      std::string n{e->d_name};
      if (ends_with(n, kMergeSuffix) || ends_with(n, kImportSuffix) || ends_with(n, ".tmp"))
        garbage.push_back(n);
    }
    ::closedir(d);
  }

  // подсказки без сегмента
  const auto seg_ids = list_segments_sorted(dir);
  const std::set<uint64_t> live(seg_ids.begin(), seg_ids.end());
  for (uint64_t id : list_segments_sorted(dir, ".hint")) {
    if (!live.count(id)) garbage.push_back(hint_name(id));
  }

  for (const auto& n : garbage) {
    spdlog::warn("recovery: removing provisional file {}", n);
    (void)::unlink(join_path(dir, n).c_str());
  }
  if (!garbage.empty()) fsync_dir_path(dir);
}

void Store::Impl::account_replace_locked(const std::optional<Location>& prev, bool replaced,
                                         const Location& loc) {
  if (!replaced) {
    segs[loc.segment_id].dead_bytes += loc.length;
    return;
  }
  if (prev) {
    auto it = segs.find(prev->segment_id);
    if (it != segs.end()) it->second.dead_bytes += prev->length;
  }
}

void Store::Impl::replay_segment(uint64_t id, bool is_last, uint64_t& max_ts) {
  auto& info = segs[id];
  std::optional<Location> prev;

  // Закрытый слитый сегмент: индекс строится по подсказке, без чтения значений
  std::vector<HintEntry> hints;
  if (!is_last && read_hint_file(dir, id, hints)) {
    for (const auto& h : hints) {
      Location loc{id, h.offset, h.length, h.timestamp, h.tombstone};
      bool replaced = index.upsert_if_newer(h.key, loc, &prev);
      info.note(h.timestamp, h.length);
      account_replace_locked(prev, replaced, loc);
      if (h.timestamp > max_ts) max_ts = h.timestamp;
    }
    info.merged = true;
    spdlog::debug("segment {}: {} entries from hint", id, hints.size());
    return;
  }

  // хвостовой сегмент станет активным, его подсказка устареет
  if (is_last) (void)::unlink(join_path(dir, hint_name(id)).c_str());

  const auto path = seg_path(id);
  SegmentScanner sc(path);
  if (!sc.good()) {
    throw StorageFault(Errc::IOFailure, fmt::format("cannot open segment {}: {}", path, std::strerror(errno)));
  }

  Record rec;
  uint64_t off = 0;
  uint32_t len = 0;
  size_t n = 0;
  for (;;) {
    auto st = sc.next(rec, off, len);
    if (st == SegmentScanner::Step::Record) {
      Location loc{id, off, len, rec.timestamp, rec.tombstone};
      bool replaced = index.upsert_if_newer(rec.key, loc, &prev);
      info.note(rec.timestamp, len);
      account_replace_locked(prev, replaced, loc);
      if (rec.timestamp > max_ts) max_ts = rec.timestamp;
      ++n;
      continue;
    }
    if (st == SegmentScanner::Step::End) break;
    if (st == SegmentScanner::Step::IOError) {
      throw StorageFault(Errc::IOFailure, fmt::format("read error in segment {}", path));
    }

    // Truncated / Corrupt
    if (!is_last) {
      throw StorageFault(Errc::CorruptRecord,
                         fmt::format("sealed segment {} corrupt at offset {}", path, sc.valid_end()));
    }
    spdlog::warn("segment {}: invalid tail at offset {}, truncating", path, sc.valid_end());
    if (::truncate(path.c_str(), static_cast<off_t>(sc.valid_end())) != 0) {
      throw StorageFault(Errc::IOFailure,
                         fmt::format("cannot truncate {}: {}", path, std::strerror(errno)));
    }
    break;
  }
  spdlog::debug("segment {}: {} records scanned", id, n);
}

void Store::Impl::recover() {
  if (!ensure_dir(dir)) {
    throw StorageFault(Errc::IOFailure, "cannot create data directory " + dir);
  }

  finish_pending_import();
  remove_provisional_files();

  // Порядок id; при равных ключах побеждает больший timestamp
  const auto ids = list_segments_sorted(dir);
  uint64_t max_ts = 0;
  {
    std::lock_guard sl(seg_mu);
    for (size_t i = 0; i < ids.size(); ++i) {
      replay_segment(ids[i], i + 1 == ids.size(), max_ts);
    }
  }
  seq = max_ts + 1;

  uint64_t applied = 0;
  if (read_u64_file(dir, kAppliedFile, applied)) last_applied = applied;

  const uint64_t active_id = ids.empty() ? 1 : ids.back();
  next_segment_id.store(active_id + 1);

  StoreError e;
  std::lock_guard wl(write_mu);
  if (!open_active_locked(active_id, &e)) {
    throw StorageFault(e.code, e.message);
  }
  spdlog::info("recovered {} keys from {} segments (active={}, offset={}, last_applied={})",
               index.live_size(), ids.size(), active.id(), active.size(), last_applied);
}

} // namespace caskkv
