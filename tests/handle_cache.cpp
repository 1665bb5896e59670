#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "caskkv/handle_cache.hpp"
#include "caskkv/segment.hpp"
#include "caskkv/util.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

using namespace caskkv;

static std::string tdir(const char* p){
  auto base = std::filesystem::temp_directory_path();
  auto d = base / (std::string(p)+std::to_string(::getpid()));
  std::filesystem::remove_all(d);
  std::filesystem::create_directories(d);
  return d.string();
}

// n сегментов по одной записи
static void make_segments(const std::string& dir, uint64_t n) {
  for (uint64_t id = 1; id <= n; ++id) {
    ActiveSegment seg;
    uint64_t off = 0;
    REQUIRE(seg.open(join_path(dir, segment_name(id)), id, FlushMode::NONE, 0));
    REQUIRE(seg.append(encode_record(Record{"k" + std::to_string(id), "v", id, false}), off));
    REQUIRE(seg.seal());
  }
}

TEST_CASE("leases beyond the limit are never closed under a reader") {
  auto dir = tdir("caskkv_hc_over_");
  make_segments(dir, 6);
  HandleCache cache(dir, 2);

  std::vector<HandleCache::Lease> held;
  for (uint64_t id = 1; id <= 6; ++id) {
    auto l = cache.acquire(id);
    REQUIRE(l);
    held.push_back(std::move(l));
  }
  // все заняты: лимит временно превышен
  REQUIRE(cache.open_count() == 6);
  REQUIRE(cache.over_limit() > 0);
  for (auto& l : held) {
    std::string frame;
    REQUIRE(read_frame_at(l.fd(), 0, static_cast<uint32_t>(kRecordOverhead + 3), frame));
  }

  held.clear();
  REQUIRE(cache.open_count() <= cache.limit());
}

TEST_CASE("LRU evicts the least recently used idle handle") {
  auto dir = tdir("caskkv_hc_lru_");
  make_segments(dir, 3);
  HandleCache cache(dir, 2);

  { auto l = cache.acquire(1); REQUIRE(l); }
  { auto l = cache.acquire(2); REQUIRE(l); }
  { auto l = cache.acquire(1); REQUIRE(l); } // 1 снова свежий
  { auto l = cache.acquire(3); REQUIRE(l); }

  REQUIRE(cache.is_open(1));
  REQUIRE_FALSE(cache.is_open(2));
  REQUIRE(cache.is_open(3));
  REQUIRE(cache.evictions() == 1);
  REQUIRE(cache.hits() == 1);
}

TEST_CASE("pinned handle is not evicted") {
  auto dir = tdir("caskkv_hc_pin_");
  make_segments(dir, 3);
  HandleCache cache(dir, 1);
  cache.pin(1);

  { auto l = cache.acquire(1); REQUIRE(l); }
  { auto l = cache.acquire(2); REQUIRE(l); }
  REQUIRE(cache.is_open(1));
  REQUIRE_FALSE(cache.is_open(2));

  cache.unpin(1);
  { auto l = cache.acquire(3); REQUIRE(l); }
  REQUIRE_FALSE(cache.is_open(1));
}

TEST_CASE("retired segment is unlinked only after the last reader") {
  auto dir = tdir("caskkv_hc_retire_");
  make_segments(dir, 2);
  HandleCache cache(dir, 4);
  const auto path = join_path(dir, segment_name(1));

  auto l = cache.acquire(1);
  REQUIRE(l);
  REQUIRE(cache.in_flight(1) == 1);
  cache.retire(1);
  REQUIRE(std::filesystem::exists(path));
  REQUIRE(cache.retired_pending() == 1);

  std::string frame;
  REQUIRE(read_frame_at(l.fd(), 0, static_cast<uint32_t>(kRecordOverhead + 3), frame));
  l.release();
  REQUIRE(cache.retired_pending() == 0);
  REQUIRE_FALSE(std::filesystem::exists(path));
  REQUIRE_FALSE(cache.is_open(1));

  // без читателей удаление сразу
  cache.retire(2);
  REQUIRE_FALSE(std::filesystem::exists(join_path(dir, segment_name(2))));
}

TEST_CASE("acquire of a missing segment fails with IOFailure") {
  auto dir = tdir("caskkv_hc_missing_");
  HandleCache cache(dir, 2);
  StoreError err;
  auto l = cache.acquire(42, &err);
  REQUIRE_FALSE(l);
  REQUIRE(err.code == Errc::IOFailure);
}

TEST_CASE("immediate retire unlinks while the reader keeps its handle") {
  auto dir = tdir("caskkv_hc_detach_");
  make_segments(dir, 1);
  HandleCache cache(dir, 4);
  const auto path = join_path(dir, segment_name(1));

  auto l = cache.acquire(1);
  REQUIRE(l);
  cache.retire(1, false);
  REQUIRE_FALSE(std::filesystem::exists(path));
  REQUIRE(cache.retired_pending() == 0);

  // открытый дескриптор дочитывает удалённый файл
  std::string frame;
  REQUIRE(read_frame_at(l.fd(), 0, static_cast<uint32_t>(kRecordOverhead + 3), frame));
  l.release();
  REQUIRE_FALSE(cache.is_open(1));
  REQUIRE(cache.open_count() == 0);
}

TEST_CASE("handle opened across a retire is not kept in the cache") {
  auto dir = tdir("caskkv_hc_gone_");
  make_segments(dir, 1);
  HandleCache cache(dir, 4);
  const auto path = join_path(dir, segment_name(1));
  const auto copy = join_path(dir, "copy");
  std::filesystem::copy_file(path, copy);

  cache.retire(1);
  REQUIRE_FALSE(std::filesystem::exists(path));

  // файл на месте к моменту open: как будто open успел до unlink
  std::filesystem::rename(copy, path);
  {
    auto l = cache.acquire(1);
    REQUIRE(l);
    REQUIRE(cache.is_open(1));
  }
  REQUIRE_FALSE(cache.is_open(1));
}
