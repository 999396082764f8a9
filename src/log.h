#pragma once

#include <string>

#include "lanlight/lanlight.h"

namespace lanlight {
namespace detail {

// Route a log line to the configured callback, or stderr when unset.
void LogError(const std::string& message, const Config* config);

void LogCallbackError(const char* name, const char* what, const Config* config);

}  // namespace detail
}  // namespace lanlight
