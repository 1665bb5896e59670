// source/snapshot.cpp
#include "caskkv/snapshot.hpp"
#include "caskkv/record.hpp"
#include "caskkv/util.hpp"

#include <cstring>

namespace caskkv {

std::string encode_snapshot(const Snapshot& snap) {
  std::string out;
  out.append(kSnapshotMagic, 8);
  put_u64(out, snap.last_applied);
  put_u64(out, static_cast<uint64_t>(snap.entries.size()));
  for (const auto& kv : snap.entries) {
    encode_record_into(out, kv.key, kv.value, 0, false);
  }
  put_u64(out, checksum64(out));
  return out;
}

bool decode_snapshot(std::string_view data, Snapshot& out, StoreError* err) {
  if (data.size() < 8 + 8 + 8 + 8 || std::memcmp(data.data(), kSnapshotMagic, 8) != 0) {
    set_error(err, Errc::CorruptRecord, "snapshot: bad header");
    return false;
  }
  const size_t body = data.size() - 8;
  if (get_u64(data.data() + body) != checksum64(data.substr(0, body))) {
    set_error(err, Errc::CorruptRecord, "snapshot: checksum mismatch");
    return false;
  }

  out.last_applied = get_u64(data.data() + 8);
  const uint64_t count = get_u64(data.data() + 16);
  out.entries.clear();

  size_t pos = 24;
  Record rec;
  while (pos < body) {
    size_t used = 0;
    if (decode_record(data.substr(pos, body - pos), rec, &used) != DecodeStatus::Ok || rec.tombstone) {
      set_error(err, Errc::CorruptRecord, "snapshot: bad entry at " + std::to_string(pos));
      return false;
    }
    out.entries.push_back({std::move(rec.key), std::move(rec.value)});
    pos += used;
  }
  if (out.entries.size() != count) {
    set_error(err, Errc::CorruptRecord, "snapshot: entry count mismatch");
    return false;
  }
  return true;
}

} // namespace caskkv
