#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace caskkv {

bool ensure_dir(const std::string& p);
std::string join_path(std::string a, std::string b);
void fsync_dir_path(const std::string& dir);

// XXH64 c seed=0
uint64_t checksum64(std::string_view data);

// Атомарная запись маленького файла: tmp -> fsync -> rename -> fsync каталога
bool write_file_atomic(const std::string& dir, const std::string& name, std::string_view body);
bool read_small_file(const std::string& path, std::string& out);

bool write_u64_file(const std::string& dir, const std::string& name, uint64_t v);
bool read_u64_file(const std::string& dir, const std::string& name, uint64_t& v);

// little-endian кодирование
inline void put_u32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}
inline void put_u64(std::string& out, uint64_t v) {
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}
inline uint32_t get_u32(const char* p) {
  uint32_t v = 0;
  for (int i = 3; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(p[i]);
  return v;
}
inline uint64_t get_u64(const char* p) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(p[i]);
  return v;
}

} // namespace caskkv
