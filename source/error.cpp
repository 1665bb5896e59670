#include "caskkv/error.hpp"

namespace caskkv {

const char* errc_name(Errc c) {
  switch (c) {
    case Errc::Ok:                        return "Ok";
    case Errc::NotFound:                  return "NotFound";
    case Errc::CorruptRecord:             return "CorruptRecord";
    case Errc::IOFailure:                 return "IOFailure";
    case Errc::CapacityTransientExceeded: return "CapacityTransientExceeded";
    case Errc::InvalidArgument:           return "InvalidArgument";
  }
  return "Unknown";
}

} // namespace caskkv
