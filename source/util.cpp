#include "caskkv/util.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <xxhash.h>

namespace caskkv {

bool ensure_dir(const std::string &p) {
  struct stat st {};
  if (stat(p.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }
  return ::mkdir(p.c_str(), 0700) == 0;
}

std::string join_path(std::string a, std::string b) {
  if (!a.empty() && a.back() != '/')
    a.push_back('/');
  a += b;
  return a;
}

void fsync_dir_path(const std::string& dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

uint64_t checksum64(std::string_view data) {
  return static_cast<uint64_t>(XXH64(data.data(), data.size(), 0));
}

bool write_file_atomic(const std::string& dir, const std::string& name, std::string_view body) {
  auto tmp = join_path(dir, name + ".tmp");
  auto dst = join_path(dir, name);

  int fd = ::open(tmp.c_str(), O_CREAT|O_TRUNC|O_WRONLY, 0644);
  if (fd < 0) return false;

  size_t off = 0;
  bool ok = true;
  while (off < body.size()) {
    ssize_t w = ::write(fd, body.data() + off, body.size() - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      ok = false;
      break;
    }
    off += static_cast<size_t>(w);
  }
  // содержимое должно лечь на диск до rename
  if (ok && ::fsync(fd) != 0) ok = false;
  ::close(fd);

  if (!ok) { ::unlink(tmp.c_str()); return false; }

  if (::rename(tmp.c_str(), dst.c_str()) != 0) {
    ::unlink(tmp.c_str());
    return false;
  }
  fsync_dir_path(dir);
  return true;
}

bool read_small_file(const std::string& path, std::string& out) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) return false;
  out.clear();
  char buf[4096];
  while (true) {
    ssize_t r = ::read(fd, buf, sizeof(buf));
    if (r < 0) {
      if (errno == EINTR) continue;
      ::close(fd);
      return false;
    }
    if (r == 0) break;
    out.append(buf, static_cast<size_t>(r));
  }
  ::close(fd);
  return true;
}

bool write_u64_file(const std::string& dir, const std::string& name, uint64_t v) {
  char buf[32];
  int n = std::snprintf(buf, sizeof(buf), "%llu\n", static_cast<unsigned long long>(v));
  return write_file_atomic(dir, name, std::string_view(buf, static_cast<size_t>(n)));
}

bool read_u64_file(const std::string& dir, const std::string& name, uint64_t& v) {
  std::string body;
  if (!read_small_file(join_path(dir, name), body) || body.empty()) return false;
  char* end = nullptr;
  unsigned long long x = std::strtoull(body.c_str(), &end, 10);
  if (end == body.c_str()) return false;
  v = static_cast<uint64_t>(x);
  return true;
}

} // namespace caskkv
