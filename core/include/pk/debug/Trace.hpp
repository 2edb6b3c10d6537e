#pragma once
#include <cstdio>

namespace pk {

// Narration sink shared by every component. Demos print to stdout;
// tests switch it off or point it at a temp file.
struct TraceConfig {
  bool enabled = true;
  std::FILE* out = nullptr; // nullptr -> stdout
};

TraceConfig& traceConfig();

// printf-style; no-op when disabled.
void trace(const char* fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 1, 2)))
#endif
  ;

// Restores the previous TraceConfig on scope exit.
class ScopedTrace {
public:
  explicit ScopedTrace(bool enabled, std::FILE* out = nullptr)
    : saved_(traceConfig()) {
    traceConfig().enabled = enabled;
    traceConfig().out = out;
  }
  ~ScopedTrace() { traceConfig() = saved_; }

  ScopedTrace(const ScopedTrace&) = delete;
  ScopedTrace& operator=(const ScopedTrace&) = delete;

private:
  TraceConfig saved_;
};

} // namespace pk
