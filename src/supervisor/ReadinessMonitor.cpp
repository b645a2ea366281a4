#include "service-supervisor/supervisor/ReadinessMonitor.hpp"
#include "service-supervisor/Logger.hpp"
#include "service-supervisor/probe/HealthProbe.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#endif

namespace svcsup {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr int kPollTimeoutMs = 100;
constexpr const char *kReplacement = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the valid UTF-8 sequence starting at i, or 0 if invalid
size_t valid_sequence_length(const std::string &s, size_t i) {
  auto c = static_cast<unsigned char>(s[i]);
  if (c < 0x80)
    return 1;

  size_t len = 0;
  unsigned char lo = 0x80, hi = 0xBF; // bounds for the second byte
  if (c >= 0xC2 && c <= 0xDF) {
    len = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
    if (c == 0xE0)
      lo = 0xA0; // overlong
    if (c == 0xED)
      hi = 0x9F; // surrogates
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
    if (c == 0xF0)
      lo = 0x90;
    if (c == 0xF4)
      hi = 0x8F;
  } else {
    return 0;
  }

  if (i + len > s.size())
    return 0;
  auto second = static_cast<unsigned char>(s[i + 1]);
  if (second < lo || second > hi)
    return 0;
  for (size_t k = 2; k < len; ++k) {
    if (!is_continuation(static_cast<unsigned char>(s[i + k])))
      return 0;
  }
  return len;
}

} // namespace

// LineSplitter

std::vector<std::string> LineSplitter::feed(const char *data, size_t size) {
  std::vector<std::string> lines;
  partial_.append(data, size);

  size_t start = 0;
  for (;;) {
    size_t nl = partial_.find('\n', start);
    if (nl == std::string::npos)
      break;
    size_t end = nl;
    if (end > start && partial_[end - 1] == '\r')
      --end;
    lines.emplace_back(partial_, start, end - start);
    start = nl + 1;
  }
  while (max_line_ > 0 && partial_.size() - start > max_line_) {
    lines.emplace_back(partial_, start, max_line_);
    start += max_line_;
  }
  partial_.erase(0, start);
  return lines;
}

std::optional<std::string> LineSplitter::finish() {
  if (partial_.empty())
    return std::nullopt;
  std::string rest;
  rest.swap(partial_);
  if (!rest.empty() && rest.back() == '\r')
    rest.pop_back();
  return rest;
}

// ReadinessMonitor

ReadinessMonitor::ReadinessMonitor(std::string marker)
    : marker_(std::move(marker)) {}

ReadinessMonitor::~ReadinessMonitor() { stop(); }

void ReadinessMonitor::attach(process::ServiceHandle &handle,
                              LineCallback on_line) {
  on_line_ = std::move(on_line);
  stop_ = false;

  auto out = handle.stdout_pipe();
  auto err = handle.stderr_pipe();
  if (out != process::invalid_pipe()) {
    readers_.emplace_back(
        [this, out]() { read_loop(out, OutputStream::Stdout); });
  }
  if (err != process::invalid_pipe()) {
    readers_.emplace_back(
        [this, err]() { read_loop(err, OutputStream::Stderr); });
  }

  LOG_DEBUG("MONITOR", "ATTACH", "Watching output of PID={} for marker '{}'",
            handle.pid(), marker_);
}

void ReadinessMonitor::stop() {
  stop_ = true;
  for (auto &t : readers_) {
    if (t.joinable())
      t.join();
  }
  readers_.clear();
}

bool ReadinessMonitor::matches_marker(const std::string &line) const {
  return !marker_.empty() && line.find(marker_) != std::string::npos;
}

LineClass ReadinessMonitor::classify(OutputStream stream,
                                     const std::string &line) {
  if (stream == OutputStream::Stdout)
    return LineClass::Info;
  // Python logging writes to stderr by default
  if (line.find(" INFO ") != std::string::npos ||
      line.find("INFO:") != std::string::npos ||
      line.find("DEBUG:") != std::string::npos)
    return LineClass::Info;
  return LineClass::Warning;
}

std::string ReadinessMonitor::decode_lossy(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size());
  size_t i = 0;
  while (i < bytes.size()) {
    size_t len = valid_sequence_length(bytes, i);
    if (len == 0) {
      out += kReplacement;
      ++i;
      continue;
    }
    out.append(bytes, i, len);
    i += len;
  }
  return out;
}

bool ReadinessMonitor::poll_health(uint16_t port,
                                   std::chrono::milliseconds timeout,
                                   const std::string &path) {
  return probe::poll_health(port, timeout, path);
}

void ReadinessMonitor::emit(OutputStream stream, const std::string &raw) {
  OutputLine line;
  line.stream = stream;
  line.text = decode_lossy(raw);
  if (line.text.empty())
    return;
  line.cls = classify(stream, line.text);
  line.marker = matches_marker(line.text);
  if (line.marker && !marker_seen_.exchange(true)) {
    LOG_DEBUG("MONITOR", "MARKER", "Readiness marker seen on {}",
              to_string(stream));
  }
  if (on_line_)
    on_line_(line);
}

// Services may print the marker without a trailing newline
void ReadinessMonitor::scan_pending(OutputStream stream,
                                   const std::string &raw) {
  if (raw.empty() || marker_seen_.load())
    return;
  if (matches_marker(decode_lossy(raw)) && !marker_seen_.exchange(true)) {
    LOG_DEBUG("MONITOR", "MARKER", "Readiness marker seen on {} (partial line)",
              to_string(stream));
  }
}

#ifdef _WIN32

void ReadinessMonitor::read_loop(process::PipeHandle pipe,
                                 OutputStream stream) {
  LineSplitter splitter;
  char buffer[kReadChunk];

  while (!stop_) {
    DWORD available = 0;
    if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr)) {
      break; // broken pipe: writer closed
    }
    if (available == 0) {
      Sleep(kPollTimeoutMs / 2);
      continue;
    }
    DWORD to_read = available < kReadChunk ? available : kReadChunk;
    DWORD n = 0;
    if (!ReadFile(pipe, buffer, to_read, &n, nullptr) || n == 0)
      break;
    for (const auto &line : splitter.feed(buffer, n))
      emit(stream, line);
    scan_pending(stream, splitter.pending());
  }

  if (auto rest = splitter.finish())
    emit(stream, *rest);
}

#else

void ReadinessMonitor::read_loop(process::PipeHandle pipe,
                                 OutputStream stream) {
  LineSplitter splitter;
  char buffer[kReadChunk];

  while (!stop_) {
    pollfd pfd{pipe, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kPollTimeoutMs);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("MONITOR", "READ", "poll on {} failed: {}", to_string(stream),
                strerror(errno));
      break;
    }
    if (rc == 0)
      continue;

    ssize_t n = ::read(pipe, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      LOG_ERROR("MONITOR", "READ", "read on {} failed: {}", to_string(stream),
                strerror(errno));
      break;
    }
    if (n == 0)
      break; // EOF
    for (const auto &line : splitter.feed(buffer, static_cast<size_t>(n)))
      emit(stream, line);
    scan_pending(stream, splitter.pending());
  }

  if (auto rest = splitter.finish())
    emit(stream, *rest);
}

#endif

} // namespace svcsup
