#pragma once
#include "service-supervisor/export.h"
#include "service-supervisor/process/ServiceHandle.hpp"
#include "service-supervisor/types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace svcsup {

enum class LineClass { Info, Warning };

/// One decoded line of service output
struct OutputLine {
  OutputStream stream = OutputStream::Stdout;
  std::string text;
  LineClass cls = LineClass::Info;
  bool marker = false; // contains the readiness phrase
};

/// Reassembles lines from arbitrary read chunks. Strips "\r\n" and "\n".
/// An unterminated run longer than the line limit is cut into lines of
/// exactly that length.
class SERVICE_SUPERVISOR_API LineSplitter {
public:
  static constexpr size_t kMaxLineLength = 64 * 1024;

  explicit LineSplitter(size_t max_line = kMaxLineLength)
      : max_line_(max_line) {}

  /// Returns every line completed by `data`
  std::vector<std::string> feed(const char *data, size_t size);

  /// Remaining partial line at end of stream, if any
  std::optional<std::string> finish();

  /// Bytes received since the last completed line
  const std::string &pending() const { return partial_; }

private:
  size_t max_line_;
  std::string partial_;
};

/// Watches a service's output for the readiness marker and provides the
/// out-of-band HTTP liveness probe. One reader thread per stream.
class SERVICE_SUPERVISOR_API ReadinessMonitor {
public:
  using LineCallback = std::function<void(const OutputLine &)>;

  explicit ReadinessMonitor(std::string marker);
  ~ReadinessMonitor();

  ReadinessMonitor(const ReadinessMonitor &) = delete;
  ReadinessMonitor &operator=(const ReadinessMonitor &) = delete;

  /// Start reading both pipes of `handle`. The handle must outlive the
  /// monitor, or stop() must be called before the handle is closed.
  void attach(process::ServiceHandle &handle, LineCallback on_line);

  /// Stop and join the reader threads. Idempotent.
  void stop();

  bool marker_seen() const { return marker_seen_.load(); }
  bool matches_marker(const std::string &line) const;
  const std::string &marker() const { return marker_; }

  static LineClass classify(OutputStream stream, const std::string &line);

  /// UTF-8 passthrough; invalid sequences become U+FFFD
  static std::string decode_lossy(const std::string &bytes);

  static bool poll_health(uint16_t port, std::chrono::milliseconds timeout,
                          const std::string &path = "/health");

private:
  void read_loop(process::PipeHandle pipe, OutputStream stream);
  void emit(OutputStream stream, const std::string &raw);
  void scan_pending(OutputStream stream, const std::string &raw);

  std::string marker_;
  LineCallback on_line_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> marker_seen_{false};
  std::vector<std::thread> readers_;
};

} // namespace svcsup
