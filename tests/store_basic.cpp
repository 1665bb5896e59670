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
#include <csignal>
#include <filesystem>
#include <string>
#include <sys/resource.h>
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

namespace {

// Временный лимит на размер файлов процесса: write упирается в EFBIG
struct FileSizeLimit {
  struct rlimit old {};
  void (*old_handler)(int) = SIG_DFL;

  explicit FileSizeLimit(uint64_t bytes) {
    ::getrlimit(RLIMIT_FSIZE, &old);
    old_handler = std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit l = old;
    l.rlim_cur = static_cast<rlim_t>(bytes);
    ::setrlimit(RLIMIT_FSIZE, &l);
  }
  ~FileSizeLimit() {
    ::setrlimit(RLIMIT_FSIZE, &old);
    std::signal(SIGXFSZ, old_handler);
  }
};

} // namespace

TEST_CASE("put, overwrite, delete, put again") {
  auto dir = tdir("caskkv_basic_");
  Store kv({.path=dir});

  REQUIRE(kv.put("k", "1"));
  REQUIRE(kv.put("k", "2"));
  REQUIRE(*kv.get("k") == "2");

  REQUIRE(kv.del("k"));
  StoreError err;
  REQUIRE_FALSE(kv.get("k", &err).has_value());
  REQUIRE(err.code == Errc::NotFound);

  REQUIRE(kv.put("k", "3"));
  REQUIRE(*kv.get("k") == "3");

  auto m = kv.get_metrics();
  REQUIRE(m.puts == 3);
  REQUIRE(m.dels == 1);
  REQUIRE(m.get_misses == 1);
}

TEST_CASE("apply returns the location a single read needs") {
  auto dir = tdir("caskkv_basic_loc_");
  Store kv({.path=dir});

  auto a = kv.apply(Op::put("a", "alpha"));
  auto b = kv.apply(Op::put("b", "beta"));
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->segment_id == kv.active_segment_id());
  REQUIRE(a->offset == 0);
  REQUIRE(b->offset == a->length);
  REQUIRE(b->length == kRecordOverhead + 1 + 4);
  REQUIRE(kv.locate("b") == b);
  REQUIRE(kv.active_segment_size() == a->length + b->length);
}

TEST_CASE("deleting a missing key appends nothing") {
  auto dir = tdir("caskkv_basic_delmiss_");
  Store kv({.path=dir});
  REQUIRE(kv.put("x", "1"));
  const auto size = kv.active_segment_size();

  StoreError err;
  REQUIRE_FALSE(kv.del("nope", &err));
  REQUIRE(err.code == Errc::NotFound);

  REQUIRE(kv.del("x"));
  err = {};
  REQUIRE_FALSE(kv.del("x", &err));
  REQUIRE(err.code == Errc::NotFound);
  REQUIRE(kv.active_segment_size() == size + kRecordOverhead + 1);
}

TEST_CASE("empty values are values, not deletions") {
  auto dir = tdir("caskkv_basic_empty_");
  Store kv({.path=dir});
  REQUIRE(kv.put("k", ""));
  auto v = kv.get("k");
  REQUIRE(v.has_value());
  REQUIRE(v->empty());
  REQUIRE(kv.list_keys() == std::vector<std::string>{"k"});
}

TEST_CASE("invalid keys are rejected without touching the segment") {
  auto dir = tdir("caskkv_basic_invalid_");
  Store kv({.path=dir});
  StoreError err;
  REQUIRE_FALSE(kv.put("", "v", &err));
  REQUIRE(err.code == Errc::InvalidArgument);
  REQUIRE_FALSE(kv.put(std::string(kMaxKeyBytes + 1, 'k'), "v", &err));
  REQUIRE(err.code == Errc::InvalidArgument);
  REQUIRE(kv.active_segment_size() == 0);
}

TEST_CASE("list_keys skips deleted keys and is sorted") {
  auto dir = tdir("caskkv_basic_list_");
  Store kv({.path=dir});
  for (auto k : {"c", "a", "b", "d"}) REQUIRE(kv.put(k, "v"));
  REQUIRE(kv.del("b"));
  REQUIRE(kv.list_keys() == std::vector<std::string>{"a", "c", "d"});
}

TEST_CASE("writes rotate the active segment at the size threshold") {
  auto dir = tdir("caskkv_basic_rotate_");
  Store kv({.path=dir, .segment_max_bytes=512});

  const auto first = kv.active_segment_id();
  for (int i = 0; i < 100; ++i) REQUIRE(kv.put("key" + std::to_string(i), std::string(20, 'v')));
  REQUIRE(kv.active_segment_id() > first);
  REQUIRE(kv.get_metrics().rotations >= 2);

  for (const auto& s : kv.segment_stats()) {
    if (!s.active) REQUIRE(s.bytes > 512);
  }
  for (int i = 0; i < 100; ++i) REQUIRE(kv.get("key" + std::to_string(i)).has_value());
}

TEST_CASE("readers run in parallel with the writer") {
  auto dir = tdir("caskkv_basic_conc_");
  Store kv({.path=dir, .file_limit=2, .segment_max_bytes=4096});

  for (int i = 0; i < 200; ++i) REQUIRE(kv.put("k" + std::to_string(i), "v" + std::to_string(i)));

  std::atomic<bool> done{false};
  std::atomic<int>  bad{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&, t]{
      int i = t;
      while (!done.load()) {
        auto key = "k" + std::to_string(i % 200);
        auto v = kv.get(key);
        if (!v || *v != "v" + std::to_string(i % 200)) ++bad;
        ++i;
      }
    });
  }
  for (int i = 200; i < 2000; ++i) REQUIRE(kv.put("w" + std::to_string(i), std::string(64, 'w')));
  done = true;
  for (auto& r : readers) r.join();

  REQUIRE(bad.load() == 0);
  REQUIRE(kv.get_metrics().cache_open_handles <= kv.options().file_limit + 4);
}

TEST_CASE("failed append reports IOFailure and leaves the index alone") {
  auto dir = tdir("caskkv_basic_ioerr_");
  Store kv({.path=dir});
  REQUIRE(kv.put("k", "v1"));
  const auto loc = kv.locate("k");
  const auto size = kv.active_segment_size();
  const auto seg = join_path(dir, segment_name(kv.active_segment_id()));

  StoreError err;
  {
    FileSizeLimit lim(size + 10);
    REQUIRE_FALSE(kv.put("k", std::string(200, 'x'), &err));
    REQUIRE_FALSE(kv.put("other", std::string(200, 'y')));
  }
  REQUIRE(err.code == Errc::IOFailure);
  REQUIRE(kv.locate("k") == loc);
  REQUIRE_FALSE(kv.locate("other").has_value());
  REQUIRE(kv.active_segment_size() == size);
  REQUIRE(std::filesystem::file_size(seg) == size);
  REQUIRE(*kv.get("k") == "v1");

  // после сбоя запись продолжается с того же места
  auto next = kv.apply(Op::put("k", "v2"));
  REQUIRE(next.has_value());
  REQUIRE(next->offset == size);
  REQUIRE(*kv.get("k") == "v2");
}
