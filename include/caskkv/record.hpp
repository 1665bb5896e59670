// include/caskkv/record.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace caskkv {

// Формат кадра (little-endian):
// [u32 klen][key][u32 vlen][value][u64 timestamp][u8 flags][u64 checksum]
// checksum = XXH64 от всех предыдущих байт кадра.
struct Record {
  std::string key;
  std::string value;
  uint64_t    timestamp = 0;
  bool        tombstone = false;

  bool operator==(const Record&) const = default;
};

static constexpr uint8_t  REC_FLAG_TOMBSTONE = 0x01u;
static constexpr size_t   kRecordOverhead    = 4 + 4 + 8 + 1 + 8;
static constexpr uint32_t kMaxKeyBytes       = 0xffffu;
static constexpr uint32_t kMaxValueBytes     = 256u * 1024 * 1024;

enum class DecodeStatus : uint8_t {
  Ok,
  Truncated, // кадр обрывается (недописанный хвост)
  Corrupt    // неверная длина или checksum
};

inline size_t encoded_size(size_t klen, size_t vlen) { return kRecordOverhead + klen + vlen; }

std::string encode_record(const Record& r);
void encode_record_into(std::string& out, std::string_view key, std::string_view value,
                        uint64_t timestamp, bool tombstone);

// Декодирует ровно один кадр из начала frame; consumed = его длина.
DecodeStatus decode_record(std::string_view frame, Record& out, size_t* consumed = nullptr);

} // namespace caskkv
