// source/segment.cpp
#include "caskkv/segment.hpp"
#include "caskkv/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace caskkv {

std::string segment_name(uint64_t id) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%06llu.cask", static_cast<unsigned long long>(id));
  return std::string(buf);
}

std::string segment_temp_name(uint64_t id, std::string_view suffix) {
  return segment_name(id) + std::string(suffix);
}

std::string hint_name(uint64_t id) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%06llu.hint", static_cast<unsigned long long>(id));
  return std::string(buf);
}

bool parse_segment_name(const std::string& name, std::string_view ext, uint64_t& id) {
  if (name.size() <= ext.size()) return false;
  if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) return false;
  const size_t digits = name.size() - ext.size();
  if (digits < 6 || digits > 19) return false;
  bool all = std::all_of(name.begin(), name.begin() + digits,
                         [](unsigned char c){ return std::isdigit(c); });
  if (!all) return false;
  id = std::stoull(name.substr(0, digits));
  return id != 0;
}

std::vector<uint64_t> list_segments_sorted(const std::string& dir, std::string_view ext) {
  std::vector<uint64_t> out;
  DIR* d = ::opendir(dir.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    uint64_t id = 0;
    if (parse_segment_name(ent->d_name, ext, id)) out.push_back(id);
  }
  ::closedir(d);
  std::sort(out.begin(), out.end());
  return out;
}

bool read_frame_at(int fd, uint64_t offset, uint32_t length, std::string& out) {
  out.resize(length);
  size_t done = 0;
  while (done < length) {
    ssize_t r = ::pread(fd, out.data() + done, length - done, static_cast<off_t>(offset + done));
    if (r < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (r == 0) return false; // кадр за концом файла
    done += static_cast<size_t>(r);
  }
  return true;
}

// ---------------- ActiveSegment ----------------

ActiveSegment::~ActiveSegment() { close_fd(); }

ActiveSegment::ActiveSegment(ActiveSegment&& o) noexcept
  : path_(std::move(o.path_)), fd_(o.fd_), id_(o.id_), size_(o.size_),
    bytes_since_sync_(o.bytes_since_sync_), sync_every_bytes_(o.sync_every_bytes_),
    flush_mode_(o.flush_mode_), broken_(o.broken_) {
  o.fd_ = -1;
}

ActiveSegment& ActiveSegment::operator=(ActiveSegment&& o) noexcept {
  if (this != &o) {
    close_fd();
    path_ = std::move(o.path_);
    fd_ = o.fd_;               o.fd_ = -1;
    id_ = o.id_;
    size_ = o.size_;
    bytes_since_sync_ = o.bytes_since_sync_;
    sync_every_bytes_ = o.sync_every_bytes_;
    flush_mode_ = o.flush_mode_;
    broken_ = o.broken_;
  }
  return *this;
}

void ActiveSegment::close_fd() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool ActiveSegment::open(const std::string& path, uint64_t id, FlushMode mode,
                         uint64_t sync_every_bytes) {
  close_fd();
  path_ = path;
  id_ = id;
  flush_mode_ = mode;
  sync_every_bytes_ = sync_every_bytes;
  bytes_since_sync_ = 0;
  broken_ = false;

  fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0600);
  if (fd_ < 0) {
    spdlog::error("segment open failed: {}: {}", path_, std::strerror(errno));
    return false;
  }
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    spdlog::error("segment fstat failed: {}", path_);
    close_fd();
    return false;
  }
  size_ = static_cast<uint64_t>(st.st_size);
  spdlog::info("segment open: {} (size={})", path_, size_);
  return true;
}

bool ActiveSegment::write_all(const char* p, size_t n) {
  size_t off = 0;
  while (off < n) {
    ssize_t w = ::write(fd_, p + off, n - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      spdlog::error("segment write failed: {}: {}", path_, std::strerror(errno));
      return false;
    }
    off += static_cast<size_t>(w);
  }
  return true;
}

// Отрезает неудавшийся кадр. Если не вышло, кадр останется в файле и
// recovery его применит, хотя вызывающий получил ошибку.
bool ActiveSegment::rollback(uint64_t start) {
  if (::ftruncate(fd_, static_cast<off_t>(start)) == 0) {
    size_ = start;
    return true;
  }
  spdlog::error("segment rollback failed: {} at offset {}: {} (segment marked broken, "
                "the failed record may reappear after restart)", path_, start, std::strerror(errno));
  broken_ = true;
  return false;
}

bool ActiveSegment::append(std::string_view frame, uint64_t& offset) {
  if (fd_ < 0 || broken_) return false;

  const uint64_t start = size_;
  if (!write_all(frame.data(), frame.size())) {
    // частично записанный кадр стал бы мусорным хвостом
    (void)rollback(start);
    return false;
  }
  size_ += frame.size();
  bytes_since_sync_ += frame.size();

  if (flush_mode_ != FlushMode::NONE && bytes_since_sync_ >= sync_every_bytes_) {
    if (!sync()) {
      // запись в page cache есть, но долговечность не подтверждена
      (void)rollback(start);
      return false;
    }
  }
  offset = start;
  return true;
}

bool ActiveSegment::sync() {
  if (fd_ < 0) return false;
  int rc = 0;
  switch (flush_mode_) {
    case FlushMode::FSYNC:     rc = ::fsync(fd_); break;
    case FlushMode::FDATASYNC: rc = ::fdatasync(fd_); break;
    case FlushMode::NONE:      rc = 0; break;
  }
  if (rc != 0) {
    spdlog::error("segment sync failed: {}: {}", path_, std::strerror(errno));
    return false;
  }
  bytes_since_sync_ = 0;
  return true;
}

bool ActiveSegment::seal() {
  if (fd_ < 0) return true;
  bool ok = (::fsync(fd_) == 0);
  if (!ok) spdlog::error("segment seal fsync failed: {}", path_);
  close_fd();
  spdlog::info("segment sealed: {} (size={})", path_, size_);
  return ok;
}

// ---------------- SegmentScanner ----------------

SegmentScanner::SegmentScanner(const std::string& path, size_t buf_bytes)
  : chunk_(buf_bytes ? buf_bytes : 64 * 1024) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
}

SegmentScanner::~SegmentScanner() { if (fd_ >= 0) ::close(fd_); }

bool SegmentScanner::fill(size_t need) {
  // сдвигаем непрочитанный остаток в начало буфера
  if (pos_ > 0) {
    buf_.erase(0, pos_);
    buf_file_off_ += pos_;
    pos_ = 0;
  }
  while (buf_.size() < need && !eof_) {
    const size_t old = buf_.size();
    const size_t want = std::max(chunk_, need - old);
    buf_.resize(old + want);
    ssize_t r = ::read(fd_, buf_.data() + old, want);
    if (r < 0) {
      buf_.resize(old);
      if (errno == EINTR) continue;
      return false;
    }
    buf_.resize(old + static_cast<size_t>(r));
    if (r == 0) eof_ = true;
  }
  return true;
}

SegmentScanner::Step SegmentScanner::next(Record& rec, uint64_t& offset, uint32_t& length) {
  if (fd_ < 0) return Step::IOError;

  // klen
  if (buf_.size() - pos_ < 4 && !fill(4)) return Step::IOError;
  if (buf_.size() - pos_ == 0) return Step::End;
  if (buf_.size() - pos_ < 4) return Step::Truncated;

  const uint32_t klen = get_u32(buf_.data() + pos_);
  if (klen == 0 || klen > kMaxKeyBytes) return Step::Corrupt;

  // klen + key + vlen
  size_t head = 4 + klen + 4;
  if (buf_.size() - pos_ < head && !fill(head)) return Step::IOError;
  if (buf_.size() - pos_ < head) return Step::Truncated;

  const uint32_t vlen = get_u32(buf_.data() + pos_ + 4 + klen);
  if (vlen > kMaxValueBytes) return Step::Corrupt;

  const size_t total = encoded_size(klen, vlen);
  if (buf_.size() - pos_ < total && !fill(total)) return Step::IOError;
  if (buf_.size() - pos_ < total) return Step::Truncated;

  size_t used = 0;
  auto st = decode_record(std::string_view(buf_.data() + pos_, total), rec, &used);
  if (st == DecodeStatus::Truncated) return Step::Truncated;
  if (st == DecodeStatus::Corrupt) return Step::Corrupt;

  offset = buf_file_off_ + pos_;
  length = static_cast<uint32_t>(used);
  pos_ += used;
  valid_end_ = offset + used;
  return Step::Record;
}

} // namespace caskkv
