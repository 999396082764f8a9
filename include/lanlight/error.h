#pragma once

#include <string>

namespace lanlight {

/**
 * Error categories reported by fallible library calls.
 */
enum class ErrorCode {
  kNone,
  /// Caller supplied an out-of-range or malformed payload; nothing was sent.
  kEncoding,
  /// Inbound frame is malformed.
  kDecoding,
  /// Local socket fault (open, bind, send).
  kTransport,
  /// Invalid configuration, detected at start.
  kConfiguration,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
};

/// Name of an error code for logs ("encoding", "transport", ...).
const char* ErrorCodeName(ErrorCode code);

/// Fill `error` if non-null and return false, for use in `return Fail(...)`.
bool Fail(Error* error, ErrorCode code, const std::string& message);

}  // namespace lanlight
