#include "caskkv/store.hpp"
#include "caskkv/util.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// ----------------------------
// Простенький парсер аргументов
// ----------------------------
struct Args {
  // общие
  std::string mode = "stats";        // put|get|del|list|merge|stats|export|import|bench
  std::vector<std::string> words;    // позиционные аргументы команды
  std::string path = "./cask";
  std::string log_level = "info";

  // опции стораджа
  uint64_t    segment_bytes = 64ull * 1024 * 1024;
  size_t      file_limit = 64;
  std::string merge_trigger = "manual";
  double      merge_ratio = 0.5;
  size_t      merge_min_segments = 4;
  bool        bg_merge = false;
  uint64_t    sync_bytes = 1ull << 20;

  // bench
  uint64_t ops = 100'000;               // сколько операций всего
  std::string ratio = "90:5:5";         // PUT:GET:DEL (в %)
  size_t key_len = 16;
  size_t val_len = 100;
  unsigned threads = 1;

  bool help = false;
};

static void print_usage(const char* prog) {
  fmt::print(
R"(Usage:
  {0} [options] COMMAND [ARGS]

Commands:
  put KEY VALUE                    : store a value
  get KEY                          : print a value
  del KEY                          : delete a key
  list                             : print all live keys
  merge                            : merge all sealed segments
  stats                            : print segment and cache statistics (default)
  export FILE                      : write a snapshot to FILE
  import FILE                      : replace the store content with a snapshot from FILE
  bench                            : run micro-benchmark

Options (storage):
  --path DIR                       : data directory (default: ./cask)
  --segment BYTES                  : segment rotation size (default: 64MiB)
  --file-limit N                   : read handle cache capacity (default: 64)
  --merge-trigger manual|ratio|count : merge policy (default: manual)
  --merge-ratio R                  : dead bytes ratio for 'ratio' (default: 0.5)
  --merge-segments N               : sealed segment count for 'count' (default: 4)
  --bg-merge on|off                : background merge thread (default: off)
  --sync-bytes BYTES               : group commit window, 0 = fsync every write (default: 1MiB)
  --log-level LEVEL                : trace|debug|info|warn|error|off (default: info)

Bench options:
  --ops N                          : total operations (default: 100000)
  --ratio PUT:GET:DEL              : mix in percent (default: 90:5:5)
  --key-len N                      : key length bytes (default: 16)
  --val-len N                      : value length bytes (default: 100)
  --threads N                      : worker threads (default: 1)

Examples:
  {0} --path /tmp/cask put user:1 alice
  {0} --path /tmp/cask --segment 1M --merge-trigger ratio bench --ops 200000 --ratio 80:15:5
)",
    prog);
}

static bool parse_bool(std::string_view s, bool& out) {
  if (s == "on" || s == "true" || s == "1") { out = true; return true; }
  if (s == "off"|| s == "false"|| s == "0") { out = false; return true; }
  return false;
}

static uint64_t parse_bytes(std::string_view s) {
  // поддержка суффиксов: K/M/G
  if (s.empty()) return 0;
  char unit = s.back();
  uint64_t mul = 1;
  std::string_view num = s;
  if (unit=='K'||unit=='k'||unit=='M'||unit=='m'||unit=='G'||unit=='g') {
    num.remove_suffix(1);
    if (unit=='K'||unit=='k') mul = 1024ull;
    if (unit=='M'||unit=='m') mul = 1024ull*1024ull;
    if (unit=='G'||unit=='g') mul = 1024ull*1024ull*1024ull;
  }
  return std::strtoull(std::string(num).c_str(), nullptr, 10) * mul;
}

static bool is_command(std::string_view t) {
  return t=="put" || t=="get" || t=="del" || t=="list" || t=="merge" || t=="stats" ||
         t=="export" || t=="import" || t=="bench";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  bool have_mode = false;
  for (int i=1;i<argc;++i) {
    std::string_view t = argv[i];
    if (t=="-h" || t=="--help") { a.help=true; break; }

    auto need_value = [&](int i)->bool { return (i+1)<argc; };

    if (!have_mode && is_command(t)) { a.mode = std::string(t); have_mode = true; continue; }
    if (t=="--path" && need_value(i)) { a.path = argv[++i]; continue; }
    if (t=="--log-level" && need_value(i)) { a.log_level = argv[++i]; continue; }
    if (t=="--segment" && need_value(i)) { a.segment_bytes = parse_bytes(argv[++i]); continue; }
    if (t=="--file-limit" && need_value(i)) { a.file_limit = std::strtoul(argv[++i],nullptr,10); continue; }
    if (t=="--merge-trigger" && need_value(i)) { a.merge_trigger = argv[++i]; continue; }
    if (t=="--merge-ratio" && need_value(i)) { a.merge_ratio = std::strtod(argv[++i],nullptr); continue; }
    if (t=="--merge-segments" && need_value(i)) { a.merge_min_segments = std::strtoul(argv[++i],nullptr,10); continue; }
    if (t=="--bg-merge" && need_value(i)) { if(!parse_bool(argv[++i], a.bg_merge)) a.help=true; continue; }
    if (t=="--sync-bytes" && need_value(i)) { a.sync_bytes = parse_bytes(argv[++i]); continue; }

    if (t=="--ops" && need_value(i)) { a.ops = std::strtoull(argv[++i],nullptr,10); continue; }
    if (t=="--ratio" && need_value(i)) { a.ratio = argv[++i]; continue; }
    if (t=="--key-len" && need_value(i)) { a.key_len = std::strtoul(argv[++i],nullptr,10); continue; }
    if (t=="--val-len" && need_value(i)) { a.val_len = std::strtoul(argv[++i],nullptr,10); continue; }
    if (t=="--threads" && need_value(i)) { a.threads = std::strtoul(argv[++i],nullptr,10); continue; }

    if (have_mode && !t.starts_with("--")) { a.words.emplace_back(t); continue; }

    // неизвестный флаг
    spdlog::warn("Unknown arg: {}", t);
    a.help = true;
  }
  return a;
}

// ----------------------------
// Вспомогалка для pXX
// ----------------------------
template<class T>
static T percentile(std::vector<T>& v, double p) {
  if (v.empty()) return T{};
  size_t idx = static_cast<size_t>(std::clamp(p, 0.0, 100.0) / 100.0 * (v.size()-1));
  std::nth_element(v.begin(), v.begin()+idx, v.end());
  return v[idx];
}

// ----------------------------
// Генерация случайных ключей/значений
// ----------------------------
static std::string rand_key(std::mt19937_64& rng, size_t len) {
  static const char alphabet[] =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
  std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet)-2);
  std::string s; s.resize(len);
  for (size_t i=0;i<len;++i) s[i]=alphabet[dist(rng)];
  return s;
}
static std::string rand_value(std::mt19937_64& rng, size_t len) {
  std::string s; s.resize(len, '\0');
  std::uniform_int_distribution<int> dist(0, 255);
  for (size_t i=0;i<len;++i) s[i]=static_cast<char>(dist(rng));
  return s;
}

// ----------------------------
// bench worker: общий Store, записи сериализуются внутри
// ----------------------------
struct BenchStats {
  uint64_t put_cnt=0, get_cnt=0, del_cnt=0, miss_cnt=0;
  std::vector<double> put_lat, get_lat, del_lat; // мкс
};

static void bench_worker(unsigned tid, const Args& a, caskkv::Store& kv,
                         uint64_t ops, uint32_t pct_put, uint32_t pct_get,
                         BenchStats& out)
{
  std::mt19937_64 rng(0xBADC0FFEEULL + tid);
  std::uniform_int_distribution<uint32_t> dice(1,100);

  out.put_lat.reserve(ops);
  out.get_lat.reserve(ops);
  out.del_lat.reserve(ops);

  // набор заранее созданных ключей для GET/DEL
  std::vector<std::string> keys;
  keys.reserve(ops/2);

  auto now = []{ return std::chrono::steady_clock::now(); };

  for (uint64_t i=0;i<ops;++i) {
    uint32_t r = dice(rng);
    if (r <= pct_put) {
      std::string k = rand_key(rng, a.key_len);
      std::string v = rand_value(rng, a.val_len);
      auto t0 = now();
      caskkv::StoreError e;
      if (!kv.put(k, v, &e)) spdlog::error("put failed: {}", e.message);
      auto t1 = now();
      out.put_lat.push_back(std::chrono::duration<double,std::micro>(t1-t0).count());
      ++out.put_cnt;
      if (keys.size()<100000) keys.push_back(std::move(k));
    } else if (r <= pct_put + pct_get) {
      if (keys.empty()) continue;
      const std::string& k = keys[rng()%keys.size()];
      auto t0 = now();
      if (!kv.get(k)) ++out.miss_cnt;
      auto t1 = now();
      out.get_lat.push_back(std::chrono::duration<double,std::micro>(t1-t0).count());
      ++out.get_cnt;
    } else {
      if (keys.empty()) continue;
      const std::string& k = keys[rng()%keys.size()];
      auto t0 = now();
      (void)kv.del(k); // NotFound для уже удалённого ключа штатный
      auto t1 = now();
      out.del_lat.push_back(std::chrono::duration<double,std::micro>(t1-t0).count());
      ++out.del_cnt;
    }
  }
}

static int run_bench(const Args& a, caskkv::Store& kv) {
  // разбор ratio
  uint32_t putP=90,getP=5,delP=5;
  {
    auto pos1 = a.ratio.find(':');
    auto pos2 = a.ratio.rfind(':');
    if (pos1!=std::string::npos && pos2!=std::string::npos && pos1!=pos2) {
      putP = std::strtoul(a.ratio.substr(0,pos1).c_str(),nullptr,10);
      getP = std::strtoul(a.ratio.substr(pos1+1,pos2-pos1-1).c_str(),nullptr,10);
      delP = std::strtoul(a.ratio.substr(pos2+1).c_str(),nullptr,10);
      if (putP+getP+delP==0) { putP=90; getP=5; delP=5; }
    }
  }

  // Разобьём общее число операций по потокам
  unsigned th = std::max(1u, a.threads);
  uint64_t per = a.ops / th;
  uint64_t rem = a.ops % th;

  std::vector<std::thread> workers;
  std::vector<BenchStats> stats(th);
  auto t0 = std::chrono::steady_clock::now();

  for (unsigned i=0;i<th;++i) {
    uint64_t my_ops = per + (i < rem ? 1 : 0);
    workers.emplace_back(bench_worker, i, std::cref(a), std::ref(kv), my_ops, putP, getP, std::ref(stats[i]));
  }
  for (auto& t : workers) t.join();

  auto t1 = std::chrono::steady_clock::now();
  double sec = std::chrono::duration<double>(t1-t0).count();

  // Свести статистику
  BenchStats tot;
  for (auto& s : stats) {
    tot.put_cnt += s.put_cnt; tot.get_cnt += s.get_cnt; tot.del_cnt += s.del_cnt;
    tot.miss_cnt += s.miss_cnt;
    tot.put_lat.insert(tot.put_lat.end(), s.put_lat.begin(), s.put_lat.end());
    tot.get_lat.insert(tot.get_lat.end(), s.get_lat.begin(), s.get_lat.end());
    tot.del_lat.insert(tot.del_lat.end(), s.del_lat.begin(), s.del_lat.end());
  }

  auto print_class = [&](std::string_view name, uint64_t cnt, std::vector<double>& lat){
    double tps = cnt / sec;
    double p50 = percentile(lat, 50.0);
    double p95 = percentile(lat, 95.0);
    double p99 = percentile(lat, 99.0);
    fmt::print("{}: ops={} ({} ops/s)  latency_us: p50={:.2f} p95={:.2f} p99={:.2f}\n",
               name, cnt, static_cast<uint64_t>(tps), p50, p95, p99);
  };

  fmt::print("=== caskkv bench @ {} (threads={}, ratio={} PUT:GET:DEL) ===\n",
             a.path, th, a.ratio);
  fmt::print("opts: segment={}B file_limit={} merge={} sync_bytes={}B bg_merge={}\n",
             a.segment_bytes, a.file_limit, a.merge_trigger, a.sync_bytes,
             (a.bg_merge?"on":"off"));
  fmt::print("total ops: {}  elapsed: {:.3f} s  overall: {} ops/s\n\n",
             a.ops, sec, static_cast<uint64_t>(a.ops/sec));

  print_class("PUT", tot.put_cnt, tot.put_lat);
  print_class("GET", tot.get_cnt, tot.get_lat);
  print_class("DEL", tot.del_cnt, tot.del_lat);
  fmt::print("GET misses: {}\n", tot.miss_cnt);

  auto m = kv.get_metrics();
  fmt::print("rotations={} merges={} reclaimed={}B cache: hits={} misses={} evictions={} over_limit={}\n",
             m.rotations, m.merges, m.merge_bytes_reclaimed,
             m.cache_hits, m.cache_misses, m.cache_evictions, m.cache_over_limit);
  return 0;
}

static void print_stats(const caskkv::Store& kv) {
  auto m = kv.get_metrics();
  fmt::print("keys={} segments={} bytes={} active={} last_applied={}\n",
             m.key_count, m.segment_count, m.segment_bytes, m.active_segment_id, m.last_applied);
  for (const auto& s : kv.segment_stats()) {
    double dead = s.bytes ? 100.0 * static_cast<double>(s.dead_bytes) / static_cast<double>(s.bytes) : 0.0;
    fmt::print("  {:06} {:>12}B dead={:5.1f}%{}{}\n", s.id, s.bytes, dead,
               s.active ? " active" : "", s.merged ? " merged" : "");
  }
}

static bool need_words(const Args& a, size_t n) {
  if (a.words.size() == n) return true;
  spdlog::error("'{}' expects {} argument(s)", a.mode, n);
  return false;
}

// ----------------------------
// main
// ----------------------------
int main(int argc, char** argv) {
  auto a = parse_args(argc, argv);
  if (a.help) { print_usage(argv[0]); return 0; }

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::from_str(a.log_level));

  // сформировать StoreOptions из флагов
  caskkv::StoreOptions opts;
  opts.path              = a.path;
  opts.file_limit        = a.file_limit;
  opts.segment_max_bytes = a.segment_bytes;
  opts.sync_every_bytes  = a.sync_bytes;
  opts.merge.background  = a.bg_merge;
  opts.merge.dead_ratio  = a.merge_ratio;
  opts.merge.min_sealed_segments = a.merge_min_segments;
  if (a.merge_trigger == "ratio")       opts.merge.trigger = caskkv::MergeTrigger::DEAD_RATIO;
  else if (a.merge_trigger == "count")  opts.merge.trigger = caskkv::MergeTrigger::SEALED_COUNT;
  else if (a.merge_trigger != "manual") {
    spdlog::error("Unknown merge trigger: {}", a.merge_trigger);
    return 2;
  }

  std::optional<caskkv::Store> kv;
  try {
    kv.emplace(opts);
  } catch (const caskkv::StorageFault& e) {
    spdlog::critical("cannot open store at {}: {} ({})", a.path, e.what(), caskkv::errc_name(e.code()));
    return 1;
  }

  caskkv::StoreError err;
  auto report = [&](bool ok) {
    if (ok) return 0;
    spdlog::error("{}: {} ({})", a.mode, err.message, caskkv::errc_name(err.code));
    return err.code == caskkv::Errc::NotFound ? 3 : 1;
  };

  if (a.mode == "put") {
    if (!need_words(a, 2)) return 2;
    return report(kv->put(a.words[0], a.words[1], &err));
  }
  if (a.mode == "get") {
    if (!need_words(a, 1)) return 2;
    auto v = kv->get(a.words[0], &err);
    if (v) fmt::print("{}\n", *v);
    return report(v.has_value());
  }
  if (a.mode == "del") {
    if (!need_words(a, 1)) return 2;
    return report(kv->del(a.words[0], &err));
  }
  if (a.mode == "list") {
    for (const auto& k : kv->list_keys()) fmt::print("{}\n", k);
    return 0;
  }
  if (a.mode == "merge") {
    caskkv::MergeReport rep;
    bool ok = kv->merge(&rep, &err);
    if (ok) {
      fmt::print("merged {} -> {} segments, {} -> {} bytes, purged {} tombstones\n",
                 rep.segments_in, rep.segments_out, rep.bytes_in, rep.bytes_out, rep.tombstones_purged);
    }
    return report(ok);
  }
  if (a.mode == "stats") {
    print_stats(*kv);
    return 0;
  }
  if (a.mode == "export") {
    if (!need_words(a, 1)) return 2;
    auto snap = kv->snapshot_export(&err);
    if (!snap) return report(false);
    auto slash = a.words[0].rfind('/');
    std::string dir  = slash == std::string::npos ? "." : a.words[0].substr(0, slash);
    std::string name = slash == std::string::npos ? a.words[0] : a.words[0].substr(slash + 1);
    if (!caskkv::write_file_atomic(dir, name, caskkv::encode_snapshot(*snap))) {
      spdlog::error("cannot write {}", a.words[0]);
      return 1;
    }
    fmt::print("exported {} keys (last_applied={})\n", snap->entries.size(), snap->last_applied);
    return 0;
  }
  if (a.mode == "import") {
    if (!need_words(a, 1)) return 2;
    std::string body;
    if (!caskkv::read_small_file(a.words[0], body)) {
      spdlog::error("cannot read {}", a.words[0]);
      return 1;
    }
    caskkv::Snapshot snap;
    if (!caskkv::decode_snapshot(body, snap, &err)) return report(false);
    bool ok = kv->snapshot_import(snap, &err);
    if (ok) fmt::print("imported {} keys (last_applied={})\n", snap.entries.size(), snap.last_applied);
    return report(ok);
  }
  if (a.mode == "bench") {
    return run_bench(a, *kv);
  }

  spdlog::error("Unknown mode: {}", a.mode);
  print_usage(argv[0]);
  return 2;
}
