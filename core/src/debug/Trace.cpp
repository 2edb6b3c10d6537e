#include "pk/debug/Trace.hpp"

#include <cstdarg>

namespace pk {

TraceConfig& traceConfig() {
  static TraceConfig cfg;
  return cfg;
}

void trace(const char* fmt, ...) {
  const TraceConfig& cfg = traceConfig();
  if (!cfg.enabled) return;

  std::FILE* out = cfg.out ? cfg.out : stdout;
  va_list args;
  va_start(args, fmt);
  std::vfprintf(out, fmt, args);
  va_end(args);
}

} // namespace pk
