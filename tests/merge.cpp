#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "caskkv/store.hpp"
#include "caskkv/util.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
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

static size_t count_files(const std::string& dir, const std::string& ext) {
  size_t n = 0;
  for (auto& e : std::filesystem::directory_iterator(dir))
    if (e.is_regular_file() && e.path().extension() == ext) ++n;
  return n;
}

TEST_CASE("merge keeps only live versions and shrinks the store") {
  auto dir = tdir("caskkv_merge_basic_");
  Store kv({.path=dir, .segment_max_bytes=2048});

  for (int r = 0; r < 5; ++r)
    for (int i = 0; i < 50; ++i)
      REQUIRE(kv.put("k" + std::to_string(i), "v" + std::to_string(r) + "-" + std::to_string(i)));
  for (int i = 0; i < 50; i += 10) REQUIRE(kv.del("k" + std::to_string(i)));

  const auto before = kv.total_segment_bytes();
  const auto active_before = kv.active_segment_id();

  MergeReport rep;
  REQUIRE(kv.merge(&rep));
  REQUIRE(rep.segments_in > 0);
  REQUIRE(rep.records_dropped > 0);
  REQUIRE(rep.tombstones_purged == 0);
  REQUIRE(kv.total_segment_bytes() < before);

  // активный остаётся сегментом с наибольшим id
  REQUIRE(kv.active_segment_id() > active_before);
  for (const auto& s : kv.segment_stats()) REQUIRE(s.id <= kv.active_segment_id());

  for (int i = 0; i < 50; ++i) {
    auto v = kv.get("k" + std::to_string(i));
    if (i % 10 == 0) REQUIRE_FALSE(v.has_value());
    else REQUIRE(*v == "v4-" + std::to_string(i));
  }
  REQUIRE(kv.get_metrics().merges == 1);
}

TEST_CASE("tombstones are purged on the second pass") {
  auto dir = tdir("caskkv_merge_purge_");
  {
    Store kv({.path=dir, .segment_max_bytes=256});
    for (int i = 0; i < 20; ++i) REQUIRE(kv.put("k" + std::to_string(i), "value"));
    for (int i = 0; i < 10; ++i) REQUIRE(kv.del("k" + std::to_string(i)));
    // большой кадр закрывает сегмент с удалениями
    REQUIRE(kv.put("filler", std::string(300, 'f')));

    MergeReport first;
    REQUIRE(kv.merge(&first));
    REQUIRE(first.tombstones_purged == 0);
    REQUIRE(kv.get_metrics().key_count == 11);

    MergeReport second;
    REQUIRE(kv.merge(&second));
    REQUIRE(second.tombstones_purged == 10);
    REQUIRE(kv.get_metrics().tombstones_purged == 10);

    for (int i = 0; i < 10; ++i) REQUIRE_FALSE(kv.get("k" + std::to_string(i)).has_value());
  }

  // после рестарта удалённые не воскресают
  Store kv({.path=dir, .segment_max_bytes=256});
  for (int i = 0; i < 20; ++i) {
    auto v = kv.get("k" + std::to_string(i));
    REQUIRE(v.has_value() == (i >= 10));
  }
  REQUIRE(kv.get("filler")->size() == 300);
}

TEST_CASE("merge outputs get hints and restart uses them") {
  auto dir = tdir("caskkv_merge_hint_");
  {
    Store kv({.path=dir, .segment_max_bytes=512});
    for (int r = 0; r < 3; ++r)
      for (int i = 0; i < 40; ++i) REQUIRE(kv.put("k" + std::to_string(i), std::to_string(r)));
    REQUIRE(kv.merge());
  }
  REQUIRE(count_files(dir, ".hint") > 0);

  {
    Store kv({.path=dir, .segment_max_bytes=512});
    for (int i = 0; i < 40; ++i) REQUIRE(*kv.get("k" + std::to_string(i)) == "2");
  }

  // испорченная подсказка: сегмент просто сканируется
  for (auto& e : std::filesystem::directory_iterator(dir)) {
    if (e.path().extension() == ".hint") {
      std::ofstream f(e.path(), std::ios::binary | std::ios::trunc);
      f << "garbage";
    }
  }
  Store kv({.path=dir, .segment_max_bytes=512});
  for (int i = 0; i < 40; ++i) REQUIRE(*kv.get("k" + std::to_string(i)) == "2");
}

TEST_CASE("old segments are deleted after merge") {
  auto dir = tdir("caskkv_merge_unlink_");
  Store kv({.path=dir, .segment_max_bytes=256});
  for (int r = 0; r < 4; ++r)
    for (int i = 0; i < 20; ++i) REQUIRE(kv.put("k" + std::to_string(i), "r" + std::to_string(r)));

  std::vector<uint64_t> sealed;
  for (const auto& s : kv.segment_stats()) if (!s.active) sealed.push_back(s.id);
  REQUIRE(sealed.size() > 2);

  REQUIRE(kv.merge());
  for (auto id : sealed) REQUIRE_FALSE(std::filesystem::exists(join_path(dir, segment_name(id))));
  REQUIRE(count_files(dir, ".merge") == 0);
}

TEST_CASE("readers see correct values while merge runs") {
  auto dir = tdir("caskkv_merge_conc_");
  Store kv({.path=dir, .file_limit=3, .segment_max_bytes=1024});
  for (int r = 0; r < 4; ++r)
    for (int i = 0; i < 100; ++i) REQUIRE(kv.put("k" + std::to_string(i), "val-" + std::to_string(i)));

  std::atomic<bool> done{false};
  std::atomic<int>  bad{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&, t]{
      int i = t * 7;
      while (!done.load()) {
        StoreError err;
        auto v = kv.get("k" + std::to_string(i % 100), &err);
        if (!v || *v != "val-" + std::to_string(i % 100)) ++bad;
        ++i;
      }
    });
  }
  std::thread writer([&]{
    for (int i = 0; i < 300; ++i) (void)kv.put("w" + std::to_string(i), "x");
  });

  for (int m = 0; m < 3; ++m) REQUIRE(kv.merge());
  writer.join();
  done = true;
  for (auto& r : readers) r.join();

  REQUIRE(bad.load() == 0);
  for (int i = 0; i < 300; ++i) REQUIRE(*kv.get("w" + std::to_string(i)) == "x");
}

TEST_CASE("keys overwritten during merge keep the newer value") {
  auto dir = tdir("caskkv_merge_race_");
  Store kv({.path=dir, .segment_max_bytes=512});
  for (int i = 0; i < 200; ++i) REQUIRE(kv.put("k" + std::to_string(i), "old"));

  std::atomic<int> failed{0};
  std::thread writer([&]{
    for (int i = 0; i < 200; ++i)
      if (!kv.put("k" + std::to_string(i), "new")) ++failed;
  });
  REQUIRE(kv.merge());
  writer.join();
  REQUIRE(failed.load() == 0);

  for (int i = 0; i < 200; ++i) REQUIRE(*kv.get("k" + std::to_string(i)) == "new");
  REQUIRE(kv.merge());
  for (int i = 0; i < 200; ++i) REQUIRE(*kv.get("k" + std::to_string(i)) == "new");
}

TEST_CASE("dead ratio trigger merges after rotation") {
  auto dir = tdir("caskkv_merge_ratio_");
  StoreOptions o{.path=dir, .segment_max_bytes=512};
  o.merge.trigger = MergeTrigger::DEAD_RATIO;
  o.merge.dead_ratio = 0.5;
  Store kv(o);

  for (int r = 0; r < 10; ++r)
    for (int i = 0; i < 10; ++i) REQUIRE(kv.put("k" + std::to_string(i), "r" + std::to_string(r)));

  REQUIRE(kv.get_metrics().merges > 0);
  for (int i = 0; i < 10; ++i) REQUIRE(*kv.get("k" + std::to_string(i)) == "r9");
}

TEST_CASE("background merge by sealed segment count") {
  auto dir = tdir("caskkv_merge_bg_");
  StoreOptions o{.path=dir, .segment_max_bytes=256};
  o.merge.trigger = MergeTrigger::SEALED_COUNT;
  o.merge.min_sealed_segments = 3;
  o.merge.background = true;
  o.merge.interval_ms = 20;
  Store kv(o);

  for (int r = 0; r < 10; ++r)
    for (int i = 0; i < 10; ++i) REQUIRE(kv.put("k" + std::to_string(i), "r" + std::to_string(r)));

  for (int spin = 0; spin < 200 && kv.get_metrics().merges == 0; ++spin)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  REQUIRE(kv.get_metrics().merges > 0);
  for (int i = 0; i < 10; ++i) REQUIRE(*kv.get("k" + std::to_string(i)) == "r9");
}
