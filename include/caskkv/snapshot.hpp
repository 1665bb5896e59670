// include/caskkv/snapshot.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "caskkv/error.hpp"

namespace caskkv {

struct KeyValue {
  std::string key;
  std::string value;

  bool operator==(const KeyValue&) const = default;
};

// Полное состояние key -> value для догоняющей реплики
struct Snapshot {
  uint64_t              last_applied = 0;
  std::vector<KeyValue> entries;
};

// [magic 8][u64 last_applied][u64 count][кадры Record...][u64 xxh64]
static constexpr char kSnapshotMagic[9] = "CASKSNP1";

std::string encode_snapshot(const Snapshot& snap);
bool decode_snapshot(std::string_view data, Snapshot& out, StoreError* err = nullptr);

} // namespace caskkv
