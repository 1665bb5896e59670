// source/compactor.cpp
#include "store_impl.hpp"
#include "caskkv/hint.hpp"
#include "caskkv/record.hpp"
#include "caskkv/util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <unistd.h>

namespace caskkv {

bool Store::Impl::merge_due() const {
  const auto& mp = opts.merge;
  if (mp.trigger == MergeTrigger::MANUAL) return false;

  const uint64_t act = active_seg.load();
  std::lock_guard sl(seg_mu);
  size_t sealed = 0;
  bool   dirty = false;
  for (const auto& [id, info] : segs) {
    if (id == act) continue;
    ++sealed;
    if (info.bytes > 0 &&
        static_cast<double>(info.dead_bytes) / static_cast<double>(info.bytes) >= mp.dead_ratio)
      dirty = true;
  }
  if (mp.trigger == MergeTrigger::SEALED_COUNT) return sealed >= mp.min_sealed_segments;
  return dirty;
}

// Вызывается под seg_mu. min_outside_ts: минимальный timestamp среди закрытых
// сегментов вне пакета: tombstone старше него ещё может что-то перекрывать.
std::vector<uint64_t> Store::Impl::select_batch_locked(bool forced, uint64_t& min_outside_ts) const {
  const auto& mp = opts.merge;
  const uint64_t act = active_seg.load();

  std::vector<uint64_t> sealed;
  for (const auto& [id, info] : segs)
    if (id != act) sealed.push_back(id);

  std::vector<uint64_t> batch;
  if (forced || (mp.trigger == MergeTrigger::SEALED_COUNT && sealed.size() >= mp.min_sealed_segments)) {
    batch = sealed;
  } else if (mp.trigger == MergeTrigger::DEAD_RATIO) {
    for (uint64_t id : sealed) {
      const auto& info = segs.at(id);
      if (info.bytes > 0 &&
          static_cast<double>(info.dead_bytes) / static_cast<double>(info.bytes) >= mp.dead_ratio)
        batch.push_back(id);
    }
  }

  min_outside_ts = UINT64_MAX;
  for (uint64_t id : sealed) {
    if (std::find(batch.begin(), batch.end(), id) != batch.end()) continue;
    min_outside_ts = std::min(min_outside_ts, segs.at(id).min_ts);
  }
  return batch;
}

bool Store::Impl::merge_once(bool forced, MergeReport* report, StoreError* err) {
  std::lock_guard ml(merge_mu);

  MergeReport rep;
  uint64_t min_outside = UINT64_MAX;
  std::vector<uint64_t> batch;
  std::map<uint64_t, bool> src_merged;

  // Шаг 1: выбор пакета
  {
    std::lock_guard wl(write_mu);
    if (!check_fenced_locked(err)) return false;
    std::lock_guard sl(seg_mu);
    batch = select_batch_locked(forced, min_outside);
    for (uint64_t id : batch) {
      const auto& info = segs.at(id);
      src_merged[id] = info.merged;
      rep.bytes_in += info.bytes;
    }
  }
  // старые сегменты прошлых слияний ещё на диске: после сбоя они вернутся
  if (cache.retired_pending() > 0) min_outside = 0;
  rep.segments_in = batch.size();
  if (batch.empty()) {
    if (report) *report = rep;
    return true;
  }
  spdlog::info("merge: {} segments, {} bytes", batch.size(), rep.bytes_in);

  struct Move  { std::string key; Location from; Location to; };
  struct Purge { std::string key; Location from; };
  struct Output {
    uint64_t               id = 0;
    SegmentInfo            info;
    std::vector<HintEntry> hints;
    bool                   promoted = false;
  };

  std::vector<Move>   moves;
  std::vector<Purge>  purges;
  std::vector<Output> outputs;
  ActiveSegment out;

  auto discard = [&]() {
    (void)out.seal();
    for (const auto& o : outputs) {
      const auto p = o.promoted ? seg_path(o.id)
                                : join_path(dir, segment_temp_name(o.id, kMergeSuffix));
      (void)::unlink(p.c_str());
      (void)::unlink(join_path(dir, hint_name(o.id)).c_str());
    }
  };
  auto fail = [&](Errc code, std::string msg) {
    discard();
    spdlog::warn("merge aborted: {}", msg);
    set_error(err, code, std::move(msg));
    if (report) *report = rep;
    return false;
  };

  // Шаг 2: копируем живые записи (вне write_mu, писатели не блокируются)
  for (uint64_t sid : batch) {
    if (stop_requested.load()) {
      discard();
      rep.interrupted = true;
      spdlog::info("merge interrupted by shutdown");
      if (report) *report = rep;
      return true;
    }

    SegmentScanner sc(seg_path(sid));
    if (!sc.good()) return fail(Errc::IOFailure, fmt::format("cannot open segment {}", sid));

    Record rec;
    uint64_t off = 0;
    uint32_t len = 0;
    for (;;) {
      auto st = sc.next(rec, off, len);
      if (st == SegmentScanner::Step::End) break;
      if (st != SegmentScanner::Step::Record) {
        return fail(st == SegmentScanner::Step::IOError ? Errc::IOFailure : Errc::CorruptRecord,
                    fmt::format("segment {} unreadable at offset {}", sid, sc.valid_end()));
      }

      const Location here{sid, off, len, rec.timestamp, rec.tombstone};
      auto cur = index.lookup(rec.key);
      if (!cur || !(*cur == here)) {
        ++rep.records_dropped;
        continue;
      }
      // tombstone пережил один проход и ничего старше него вне пакета нет
      if (rec.tombstone && src_merged[sid] && rec.timestamp < min_outside) {
        purges.push_back(Purge{std::move(rec.key), here});
        continue;
      }

      if (!out.is_open() || out.size() > opts.segment_max_bytes) {
        if (out.is_open() && !out.seal()) return fail(Errc::IOFailure, "seal of merge output failed");
        const uint64_t id = next_segment_id.fetch_add(1);
        outputs.push_back(Output{id, {}, {}, false});
        if (!out.open(join_path(dir, segment_temp_name(id, kMergeSuffix)), id, FlushMode::NONE, 0)) {
          return fail(Errc::IOFailure, fmt::format("cannot create merge output {}", id));
        }
      }

      const std::string frame = encode_record(rec);
      uint64_t noff = 0;
      if (!out.append(frame, noff)) return fail(Errc::IOFailure, "merge output append failed");

      const Location to{out.id(), noff, static_cast<uint32_t>(frame.size()), rec.timestamp, rec.tombstone};
      auto& o = outputs.back();
      o.info.note(to.timestamp, to.length);
      o.hints.push_back(HintEntry{rec.key, noff, to.length, to.timestamp, to.tombstone});
      moves.push_back(Move{std::move(rec.key), here, to});
      ++rep.records_kept;
    }
  }
  if (out.is_open() && !out.seal()) return fail(Errc::IOFailure, "seal of merge output failed");

  // Шаг 3: выходы становятся обычными сегментами. Сначала ротация: у активного
  // сегмента наибольший id на диске ещё до появления выходов.
  {
    std::lock_guard wl(write_mu);
    if (!outputs.empty() && outputs.back().id > active.id()) {
      StoreError re;
      if (!rotate_locked(&re)) {
        return fail(re.code, fmt::format("pre-promote rotation failed: {}", re.message));
      }
    }
  }
  for (auto& o : outputs) {
    const auto from = join_path(dir, segment_temp_name(o.id, kMergeSuffix));
    if (::rename(from.c_str(), seg_path(o.id).c_str()) != 0) {
      return fail(Errc::IOFailure, fmt::format("cannot promote {}", from));
    }
    o.promoted = true;
    if (opts.merge.write_hints) (void)write_hint_file(dir, o.id, o.hints);
    rep.bytes_out += o.info.bytes;
  }
  fsync_dir_path(dir);

  // Шаг 4: перенаправляем индекс; ключи, изменённые за время слияния, не трогаем
  {
    std::lock_guard wl(write_mu);
    {
      std::lock_guard sl(seg_mu);
      for (auto& o : outputs) {
        o.info.merged = true;
        segs[o.id] = o.info;
      }
      for (const auto& m : moves) {
        if (!index.compare_and_swap(m.key, m.from, m.to))
          segs[m.to.segment_id].dead_bytes += m.to.length;
      }
      for (const auto& p : purges) {
        if (index.remove_if(p.key, p.from)) ++rep.tombstones_purged;
      }
      for (uint64_t id : batch) segs.erase(id);
    }
  }

  // Шаг 5: старые сегменты удаляются, когда уйдут читатели
  for (uint64_t id : batch) cache.retire(id);

  rep.segments_out = outputs.size();
  ++merges;
  tombstones_purged += rep.tombstones_purged;
  if (rep.bytes_in > rep.bytes_out) merge_bytes_reclaimed += rep.bytes_in - rep.bytes_out;

  spdlog::info("merge done: {} -> {} segments, {} -> {} bytes, kept={}, dropped={}, purged={}",
               rep.segments_in, rep.segments_out, rep.bytes_in, rep.bytes_out,
               rep.records_kept, rep.records_dropped, rep.tombstones_purged);
  if (report) *report = rep;
  return true;
}

void Store::Impl::merger_thread() {
  std::unique_lock lk(bg_mu);
  while (true) {
    bg_cv.wait_for(lk, std::chrono::milliseconds(opts.merge.interval_ms ? opts.merge.interval_ms : 1000),
                   [&]{ return stopping || need_merge; });
    if (stopping) break;
    need_merge = false;

    lk.unlock();
    if (merge_due()) {
      StoreError e;
      if (!merge_once(false, nullptr, &e)) spdlog::warn("background merge failed: {}", e.message);
    }
    lk.lock();
  }
}

void Store::Impl::start_bg() {
  if (!opts.merge.background || opts.merge.trigger == MergeTrigger::MANUAL) return;
  bg_merger = std::thread([this]{ merger_thread(); });
}

// Корректно остановить фон, если он есть
void Store::Impl::stop_bg() {
  stop_requested.store(true);
  {
    std::lock_guard lk(bg_mu);
    stopping = true;
    need_merge = false;
  }
  bg_cv.notify_all();
  if (bg_merger.joinable()) bg_merger.join();
}

} // namespace caskkv
