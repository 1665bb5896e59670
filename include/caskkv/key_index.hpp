// include/caskkv/key_index.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace caskkv {

// Положение актуальной записи ключа: ровно один pread по (segment_id, offset, length).
struct Location {
  uint64_t segment_id = 0;
  uint64_t offset     = 0;
  uint32_t length     = 0;
  uint64_t timestamp  = 0;
  bool     tombstone  = false;

  bool operator==(const Location&) const = default;
};

// Шардированный индекс key -> Location. Значения копируются при чтении.
class KeyIndex {
public:
  static constexpr size_t kShards = 16;

  KeyIndex() = default;
  KeyIndex(const KeyIndex&) = delete;
  KeyIndex& operator=(const KeyIndex&) = delete;

  // Безусловная перезапись; в prev прежняя запись, если была
  void upsert(std::string_view key, const Location& loc, std::optional<Location>* prev = nullptr);

  // Для восстановления: перезаписывает, только если loc.timestamp >= текущего
  bool upsert_if_newer(std::string_view key, const Location& loc, std::optional<Location>* prev = nullptr);

  std::optional<Location> lookup(std::string_view key) const;

  // Для компактора: перенаправить, только если ключ всё ещё указывает на expected
  bool compare_and_swap(std::string_view key, const Location& expected, const Location& desired);
  bool remove_if(std::string_view key, const Location& expected);

  void for_each(const std::function<void(const std::string&, const Location&)>& fn) const;

  size_t size() const;
  size_t live_size() const; // без tombstone
  void clear();

private:
  struct Shard {
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, Location> map;
  };

  Shard& shard_for(std::string_view key);
  const Shard& shard_for(std::string_view key) const;

  std::array<Shard, kShards> shards_;
};

} // namespace caskkv
