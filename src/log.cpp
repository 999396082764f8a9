#include "log.h"

#include <iostream>

namespace lanlight {
namespace detail {

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[lanlight] " << message << std::endl;
}

void LogCallbackError(const char* name, const char* what, const Config* config) {
  std::string message = "callback threw exception: ";
  message += name;
  if (what && *what) {
    message += ": ";
    message += what;
  }
  LogError(message, config);
}

}  // namespace detail
}  // namespace lanlight
