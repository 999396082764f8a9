#include "lanlight/error.h"

namespace lanlight {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kEncoding:
      return "encoding";
    case ErrorCode::kDecoding:
      return "decoding";
    case ErrorCode::kTransport:
      return "transport";
    case ErrorCode::kConfiguration:
      return "configuration";
  }
  return "unknown";
}

bool Fail(Error* error, ErrorCode code, const std::string& message) {
  if (error) {
    error->code = code;
    error->message = message;
  }
  return false;
}

}  // namespace lanlight
