#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace caskkv {

enum class Errc : uint8_t {
  Ok,
  NotFound,                  // ключ отсутствует или удалён (штатный результат)
  CorruptRecord,             // checksum/формат
  IOFailure,
  CapacityTransientExceeded, // кэш дескрипторов временно сверх лимита
  InvalidArgument
};

const char* errc_name(Errc c);

struct StoreError {
  Errc        code = Errc::Ok;
  std::string message;
};

inline void set_error(StoreError* err, Errc code, std::string msg) {
  if (!err) return;
  err->code = code;
  err->message = std::move(msg);
}

// Фатальная ошибка при старте (восстановление не может продолжаться)
class StorageFault : public std::runtime_error {
public:
  StorageFault(Errc code, const std::string& what)
      : std::runtime_error(what), code_(code) {}
  Errc code() const noexcept { return code_; }

private:
  Errc code_;
};

} // namespace caskkv
