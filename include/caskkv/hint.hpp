// include/caskkv/hint.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace caskkv {

// Подсказка для слитого сегмента: индексные записи без значений.
// [magic 8][{u32 klen, key, u64 offset, u32 length, u64 ts, u8 tomb}...][u64 count][u64 xxh64]
struct HintEntry {
  std::string key;
  uint64_t    offset = 0;
  uint32_t    length = 0;
  uint64_t    timestamp = 0;
  bool        tombstone = false;
};

static constexpr char kHintMagic[9] = "CASKHNT1";

bool write_hint_file(const std::string& dir, uint64_t segment_id, const std::vector<HintEntry>& entries);

// false: подсказки нет или она повреждена (тогда сегмент сканируется)
bool read_hint_file(const std::string& dir, uint64_t segment_id, std::vector<HintEntry>& out);

} // namespace caskkv
