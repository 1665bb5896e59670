// include/caskkv/segment.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "caskkv/record.hpp"

namespace caskkv {

enum class FlushMode : uint8_t { FDATASYNC, FSYNC, NONE };

// имя файла сегмента: 000001.cask
std::string segment_name(uint64_t id);
// суффиксы для провизорных файлов (merge / import) и подсказок
std::string segment_temp_name(uint64_t id, std::string_view suffix);
std::string hint_name(uint64_t id);

// Разбирает "000123.cask" -> 123
bool parse_segment_name(const std::string& name, std::string_view ext, uint64_t& id);

// id сегментов в каталоге по возрастанию
std::vector<uint64_t> list_segments_sorted(const std::string& dir, std::string_view ext = ".cask");

// Один позиционный pread; length известна из индекса.
bool read_frame_at(int fd, uint64_t offset, uint32_t length, std::string& out);

// Единственный записываемый сегмент (хвост).
class ActiveSegment {
public:
  ActiveSegment() = default;
  ~ActiveSegment();

  ActiveSegment(const ActiveSegment&) = delete;
  ActiveSegment& operator=(const ActiveSegment&) = delete;
  ActiveSegment(ActiveSegment&&) noexcept;
  ActiveSegment& operator=(ActiveSegment&&) noexcept;

  // Открыть (создать) сегмент для дозаписи; существующий хвост сохраняется.
  bool open(const std::string& path, uint64_t id, FlushMode mode, uint64_t sync_every_bytes);

  // Дописывает кадр; в offset позиция начала кадра.
  bool append(std::string_view frame, uint64_t& offset);

  bool sync();
  // fsync + close; после seal сегмент неизменяем
  bool seal();

  bool     is_open() const noexcept { return fd_ >= 0; }
  bool     broken()  const noexcept { return broken_; }
  uint64_t id()      const noexcept { return id_; }
  uint64_t size()    const noexcept { return size_; }
  const std::string& path() const noexcept { return path_; }

private:
  bool write_all(const char* p, size_t n);
  bool rollback(uint64_t start);
  void close_fd();

  std::string path_;
  int         fd_ = -1;
  uint64_t    id_ = 0;
  uint64_t    size_ = 0;
  uint64_t    bytes_since_sync_ = 0;
  uint64_t    sync_every_bytes_ = 0;
  FlushMode   flush_mode_ = FlushMode::FDATASYNC;
  bool        broken_ = false;
};

// Последовательное чтение сегмента с начала, буферами (без загрузки файла целиком).
class SegmentScanner {
public:
  explicit SegmentScanner(const std::string& path, size_t buf_bytes = 64 * 1024);
  ~SegmentScanner();

  SegmentScanner(const SegmentScanner&) = delete;
  SegmentScanner& operator=(const SegmentScanner&) = delete;

  bool good() const { return fd_ >= 0; }

  enum class Step : uint8_t { Record, End, Truncated, Corrupt, IOError };

  // положение кадра в файле
  Step next(Record& rec, uint64_t& offset, uint32_t& length);

  // смещение конца последнего корректного кадра
  uint64_t valid_end() const { return valid_end_; }

private:
  bool fill(size_t need);

  int         fd_ = -1;
  std::string buf_;
  size_t      pos_ = 0;          // позиция в buf_
  uint64_t    buf_file_off_ = 0; // смещение buf_[0] в файле
  uint64_t    valid_end_ = 0;
  size_t      chunk_;
  bool        eof_ = false;
};

} // namespace caskkv
