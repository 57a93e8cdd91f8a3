/**
 * @file SystemInfo.cpp
 * @brief procfs-backed system snapshot collection.
 */

#include "src/system/inc/SystemInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"

#include <sys/sysinfo.h> // sysinfo
#include <sys/utsname.h> // uname

#include <array>   // std::array
#include <cstdio>  // fopen, fgets, fclose
#include <cstdlib> // strtoull
#include <cstring> // strncmp, strchr

#include <fmt/core.h>

namespace vitals {

namespace system {

using vitals::helpers::files::readNodeText;
using vitals::helpers::format::bytesToMebibytes;

namespace {

/* ----------------------------- Meminfo Parsing ----------------------------- */

/// Parse "FieldName:    12345 kB" into bytes.
inline std::uint64_t parseMeminfoKb(const char* line) noexcept {
  const char* colon = std::strchr(line, ':');
  if (colon == nullptr) {
    return 0;
  }
  char* end = nullptr;
  const unsigned long long KB = std::strtoull(colon + 1, &end, 10);
  if (end == colon + 1) {
    return 0;
  }
  return static_cast<std::uint64_t>(KB) * 1024ULL;
}

/// True if line starts with "key:" exactly.
inline bool hasKey(const char* line, const char* key, std::size_t keyLen) noexcept {
  return std::strncmp(line, key, keyLen) == 0 && line[keyLen] == ':';
}

/* ----------------------------- Syscall Fallbacks ----------------------------- */

/// Memory totals via sysinfo(2).
inline bool sysinfoTotals(MemoryTotals& out) noexcept {
  struct sysinfo si{};
  if (::sysinfo(&si) != 0) {
    return false;
  }
  const std::uint64_t UNIT = (si.mem_unit == 0) ? 1ULL : static_cast<std::uint64_t>(si.mem_unit);
  out.totalBytes = static_cast<std::uint64_t>(si.totalram) * UNIT;
  out.availableBytes =
      (static_cast<std::uint64_t>(si.freeram) + static_cast<std::uint64_t>(si.bufferram)) * UNIT;
  return true;
}

/// Kernel release via uname(2).
inline std::optional<std::string> unameRelease() {
  struct utsname uts{};
  if (::uname(&uts) != 0 || uts.release[0] == '\0') {
    return std::nullopt;
  }
  return std::string(uts.release);
}

} // namespace

/* ----------------------------- MemoryTotals ----------------------------- */

std::uint64_t MemoryTotals::usedBytes() const noexcept {
  return (totalBytes >= availableBytes) ? (totalBytes - availableBytes) : 0;
}

bool readMemoryTotals(const char* meminfoPath, MemoryTotals& out) noexcept {
  if (meminfoPath == nullptr) {
    return false;
  }

  std::FILE* file = std::fopen(meminfoPath, "r");
  if (file == nullptr) {
    return false;
  }

  std::uint64_t total = 0;
  std::uint64_t available = 0;
  std::uint64_t freeBytes = 0;
  std::uint64_t buffers = 0;
  std::uint64_t cached = 0;
  std::uint64_t reclaimable = 0;
  bool hasTotal = false;
  bool hasAvailable = false;

  std::array<char, 256> lineBuf{};
  while (std::fgets(lineBuf.data(), static_cast<int>(lineBuf.size()), file) != nullptr) {
    const char* LINE = lineBuf.data();
    if (hasKey(LINE, "MemTotal", 8)) {
      total = parseMeminfoKb(LINE);
      hasTotal = true;
    } else if (hasKey(LINE, "MemAvailable", 12)) {
      available = parseMeminfoKb(LINE);
      hasAvailable = true;
    } else if (hasKey(LINE, "MemFree", 7)) {
      freeBytes = parseMeminfoKb(LINE);
    } else if (hasKey(LINE, "Buffers", 7)) {
      buffers = parseMeminfoKb(LINE);
    } else if (hasKey(LINE, "Cached", 6)) {
      cached = parseMeminfoKb(LINE);
    } else if (hasKey(LINE, "SReclaimable", 12)) {
      reclaimable = parseMeminfoKb(LINE);
    }
  }
  std::fclose(file);

  if (!hasTotal) {
    return false;
  }

  out.totalBytes = total;
  // Pre-3.14 kernels lack MemAvailable
  out.availableBytes = hasAvailable ? available : (freeBytes + buffers + cached + reclaimable);
  return true;
}

/* ----------------------------- SystemSnapshot ----------------------------- */

std::string SystemSnapshot::toString() const {
  return fmt::format("CPU: {:.1f}%\n"
                     "Memory: {} / {} MiB\n"
                     "Kernel: {}",
                     globalCpuUsage, bytesToMebibytes(usedMemoryBytes),
                     bytesToMebibytes(totalMemoryBytes), kernelVersion.value_or("unknown"));
}

/* ----------------------------- LinuxSystemInfo ----------------------------- */

SystemSnapshot LinuxSystemInfo::refreshCpu(const SystemSnapshot& previous) {
  SystemSnapshot next = previous;

  const std::string STAT_PATH = config_.procRoot + "/stat";
  cpu::CpuTimeCounters now{};
  if (!cpu::readCpuTimeCounters(STAT_PATH.c_str(), now)) {
    // Keep the last good capture so a later refresh can still form a delta
    next.globalCpuUsage = 0.0;
    return next;
  }

  next.globalCpuUsage =
      previous.hasCpuCounters ? cpu::computeBusyPercent(previous.cpuCounters, now) : 0.0;
  next.cpuCounters = now;
  next.hasCpuCounters = true;
  return next;
}

SystemSnapshot LinuxSystemInfo::refreshAll(const SystemSnapshot& previous) {
  SystemSnapshot next = refreshCpu(previous);

  const std::string MEMINFO_PATH = config_.procRoot + "/meminfo";
  MemoryTotals totals{};
  if (readMemoryTotals(MEMINFO_PATH.c_str(), totals) ||
      (config_.syscallFallbacks && sysinfoTotals(totals))) {
    next.totalMemoryBytes = totals.totalBytes;
    next.usedMemoryBytes = totals.usedBytes();
  } else {
    next.totalMemoryBytes = 0;
    next.usedMemoryBytes = 0;
  }

  next.kernelVersion = readNodeText(config_.procRoot + "/sys/kernel/osrelease");
  if (next.kernelVersion && next.kernelVersion->empty()) {
    next.kernelVersion.reset();
  }
  if (!next.kernelVersion && config_.syscallFallbacks) {
    next.kernelVersion = unameRelease();
  }

  return next;
}

} // namespace system

} // namespace vitals
