// source/record.cpp
#include "caskkv/record.hpp"
#include "caskkv/util.hpp"

namespace caskkv {

void encode_record_into(std::string& out, std::string_view key, std::string_view value,
                        uint64_t timestamp, bool tombstone) {
  const size_t start = out.size();
  out.reserve(start + encoded_size(key.size(), value.size()));
  put_u32(out, static_cast<uint32_t>(key.size()));
  out.append(key.data(), key.size());
  put_u32(out, static_cast<uint32_t>(value.size()));
  out.append(value.data(), value.size());
  put_u64(out, timestamp);
  out.push_back(static_cast<char>(tombstone ? REC_FLAG_TOMBSTONE : 0u));
  const uint64_t h = checksum64(std::string_view(out.data() + start, out.size() - start));
  put_u64(out, h);
}

std::string encode_record(const Record& r) {
  std::string out;
  encode_record_into(out, r.key, r.tombstone ? std::string_view{} : std::string_view(r.value),
                     r.timestamp, r.tombstone);
  return out;
}

DecodeStatus decode_record(std::string_view frame, Record& out, size_t* consumed) {
  const char* p = frame.data();
  const size_t n = frame.size();
  size_t pos = 0;

  if (n < 4) return DecodeStatus::Truncated;
  const uint32_t klen = get_u32(p);
  pos += 4;
  if (klen == 0 || klen > kMaxKeyBytes) return DecodeStatus::Corrupt;
  if (n < pos + klen + 4) return DecodeStatus::Truncated;
  const size_t key_off = pos;
  pos += klen;

  const uint32_t vlen = get_u32(p + pos);
  pos += 4;
  if (vlen > kMaxValueBytes) return DecodeStatus::Corrupt;
  if (n < pos + vlen + 8 + 1 + 8) return DecodeStatus::Truncated;
  const size_t val_off = pos;
  pos += vlen;

  const uint64_t ts = get_u64(p + pos);
  pos += 8;
  const uint8_t flags = static_cast<uint8_t>(p[pos]);
  pos += 1;
  if ((flags & ~REC_FLAG_TOMBSTONE) != 0) return DecodeStatus::Corrupt;

  const uint64_t stored = get_u64(p + pos);
  if (stored != checksum64(std::string_view(p, pos))) return DecodeStatus::Corrupt;
  pos += 8;

  out.key.assign(p + key_off, klen);
  out.value.assign(p + val_off, vlen);
  out.timestamp = ts;
  out.tombstone = (flags & REC_FLAG_TOMBSTONE) != 0;
  if (consumed) *consumed = pos;
  return DecodeStatus::Ok;
}

} // namespace caskkv
