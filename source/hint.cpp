// source/hint.cpp
#include "caskkv/hint.hpp"
#include "caskkv/record.hpp"
#include "caskkv/segment.hpp"
#include "caskkv/util.hpp"

#include <spdlog/spdlog.h>

#include <cstring>

namespace caskkv {

bool write_hint_file(const std::string& dir, uint64_t segment_id, const std::vector<HintEntry>& entries) {
  std::string body;
  body.append(kHintMagic, 8);
  for (const auto& e : entries) {
    put_u32(body, static_cast<uint32_t>(e.key.size()));
    body += e.key;
    put_u64(body, e.offset);
    put_u32(body, e.length);
    put_u64(body, e.timestamp);
    body.push_back(static_cast<char>(e.tombstone ? 1 : 0));
  }
  put_u64(body, static_cast<uint64_t>(entries.size()));
  put_u64(body, checksum64(body));

  if (!write_file_atomic(dir, hint_name(segment_id), body)) {
    spdlog::warn("hint write failed for segment {}", segment_id);
    return false;
  }
  return true;
}

bool read_hint_file(const std::string& dir, uint64_t segment_id, std::vector<HintEntry>& out) {
  std::string body;
  if (!read_small_file(join_path(dir, hint_name(segment_id)), body)) return false;
  if (body.size() < 8 + 16) return false;
  if (std::memcmp(body.data(), kHintMagic, 8) != 0) return false;

  const size_t tail = body.size() - 16;
  const uint64_t count = get_u64(body.data() + tail);
  const uint64_t stored = get_u64(body.data() + tail + 8);
  if (stored != checksum64(std::string_view(body.data(), tail + 8))) {
    spdlog::warn("hint checksum mismatch for segment {}", segment_id);
    return false;
  }

  out.clear();
  size_t pos = 8;
  while (pos < tail) {
    if (tail - pos < 4) return false;
    const uint32_t klen = get_u32(body.data() + pos);
    pos += 4;
    if (klen == 0 || klen > kMaxKeyBytes || tail - pos < klen + 8 + 4 + 8 + 1) return false;
    HintEntry e;
    e.key.assign(body.data() + pos, klen);
    pos += klen;
    e.offset = get_u64(body.data() + pos);     pos += 8;
    e.length = get_u32(body.data() + pos);     pos += 4;
    e.timestamp = get_u64(body.data() + pos);  pos += 8;
    e.tombstone = body[pos] != 0;              pos += 1;
    out.push_back(std::move(e));
  }
  return out.size() == count;
}

} // namespace caskkv
