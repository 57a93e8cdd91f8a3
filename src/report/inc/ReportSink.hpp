#ifndef VITALS_REPORT_REPORT_SINK_HPP
#define VITALS_REPORT_REPORT_SINK_HPP
/**
 * @file ReportSink.hpp
 * @brief Delivery boundary for rendered reports.
 *
 * The transport (chat bot, socket, file) lives behind ReportSink. A failed
 * delivery is reported once to the caller and never retried.
 */

#include <cstdio>  // std::FILE
#include <string>  // std::string
#include <utility> // std::move

namespace vitals {

namespace report {

/* ----------------------------- ReportSink ----------------------------- */

/**
 * @brief Destination for a rendered report.
 */
class ReportSink {
public:
  virtual ~ReportSink() = default;

  /**
   * @brief Deliver one rendered report.
   * @param text Rendered report.
   * @param error Set to a description on failure.
   * @return true if the transport accepted the text.
   */
  [[nodiscard]] virtual bool deliver(const std::string& text, std::string& error) = 0;
};

/* ----------------------------- StreamSink ----------------------------- */

/**
 * @brief Writes reports to an already-open stdio stream (e.g. stdout).
 * @note Does not own the stream.
 */
class StreamSink final : public ReportSink {
public:
  explicit StreamSink(std::FILE* stream) noexcept : stream_(stream) {}

  [[nodiscard]] bool deliver(const std::string& text, std::string& error) override;

private:
  std::FILE* stream_;
};

/* ----------------------------- FileSink ----------------------------- */

/**
 * @brief Writes each report to a file, replacing previous contents.
 */
class FileSink final : public ReportSink {
public:
  explicit FileSink(std::string path) : path_(std::move(path)) {}

  [[nodiscard]] bool deliver(const std::string& text, std::string& error) override;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
};

} // namespace report

} // namespace vitals

#endif // VITALS_REPORT_REPORT_SINK_HPP
