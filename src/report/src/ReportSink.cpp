/**
 * @file ReportSink.cpp
 * @brief stdio and file report sinks.
 */

#include "src/report/inc/ReportSink.hpp"

#include <cerrno>  // errno
#include <cstring> // std::strerror

#include <fmt/core.h>

namespace vitals {

namespace report {

namespace {

/// Write all of text and a trailing newline; false on short write.
/// Clears errno first.
inline bool writeAll(std::FILE* stream, const std::string& text) noexcept {
  errno = 0;
  if (std::fwrite(text.data(), 1, text.size(), stream) != text.size()) {
    return false;
  }
  if (std::fputc('\n', stream) == EOF) {
    return false;
  }
  return std::fflush(stream) == 0;
}

/// Description of the errno left by a failed write.
inline std::string writeErrorText(int err) {
  return (err == 0) ? std::string("short write") : std::string(std::strerror(err));
}

} // namespace

/* ----------------------------- StreamSink ----------------------------- */

bool StreamSink::deliver(const std::string& text, std::string& error) {
  if (stream_ == nullptr) {
    error = "no output stream";
    return false;
  }
  if (!writeAll(stream_, text)) {
    error = fmt::format("write failed: {}", writeErrorText(errno));
    return false;
  }
  return true;
}

/* ----------------------------- FileSink ----------------------------- */

bool FileSink::deliver(const std::string& text, std::string& error) {
  std::FILE* file = std::fopen(path_.c_str(), "w");
  if (file == nullptr) {
    error = fmt::format("cannot open '{}': {}", path_, std::strerror(errno));
    return false;
  }

  const bool WROTE = writeAll(file, text);
  const int WRITE_ERRNO = errno;
  errno = 0;
  const bool CLOSED = std::fclose(file) == 0;
  if (!WROTE || !CLOSED) {
    error = fmt::format("cannot write '{}': {}", path_,
                        writeErrorText(WROTE ? errno : WRITE_ERRNO));
    return false;
  }
  return true;
}

} // namespace report

} // namespace vitals
