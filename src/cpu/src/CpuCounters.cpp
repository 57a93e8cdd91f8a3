/**
 * @file CpuCounters.cpp
 * @brief Aggregate CPU counter collection from /proc/stat.
 */

#include "src/cpu/inc/CpuCounters.hpp"

#include <array>   // std::array
#include <cstdio>  // fopen, fgets, fclose
#include <cstdlib> // strtoull
#include <cstring> // strncmp

#include <fmt/core.h>

namespace vitals {

namespace cpu {

/* ----------------------------- CpuTimeCounters ----------------------------- */

std::uint64_t CpuTimeCounters::total() const noexcept {
  return user + nice + system + idle + iowait + irq + softirq + steal + guest + guestNice;
}

std::uint64_t CpuTimeCounters::busy() const noexcept {
  const std::uint64_t TOTAL = total();
  const std::uint64_t INACTIVE = idle + iowait;
  return (TOTAL >= INACTIVE) ? (TOTAL - INACTIVE) : 0;
}

std::string CpuTimeCounters::toString() const {
  return fmt::format("user={} nice={} sys={} idle={} iowait={} irq={} softirq={} steal={}", user,
                     nice, system, idle, iowait, irq, softirq, steal);
}

/* ----------------------------- API ----------------------------- */

bool parseAggregateCpuLine(const char* line, CpuTimeCounters& out) noexcept {
  // "cpu " only; "cpu0 ", "cpu1 " ... are per-core lines
  if (line == nullptr || std::strncmp(line, "cpu ", 4) != 0) {
    return false;
  }

  const char* ptr = line + 4;
  std::array<std::uint64_t, 10> vals{};
  for (std::size_t i = 0; i < vals.size(); ++i) {
    while (*ptr == ' ') {
      ++ptr;
    }
    char* end = nullptr;
    vals[i] = std::strtoull(ptr, &end, 10);
    if (end == ptr) {
      vals[i] = 0;
      break;
    }
    ptr = end;
  }

  out.user = vals[0];
  out.nice = vals[1];
  out.system = vals[2];
  out.idle = vals[3];
  out.iowait = vals[4];
  out.irq = vals[5];
  out.softirq = vals[6];
  out.steal = vals[7];
  out.guest = vals[8];
  out.guestNice = vals[9];
  return true;
}

bool readCpuTimeCounters(const char* statPath, CpuTimeCounters& out) noexcept {
  if (statPath == nullptr) {
    return false;
  }

  std::FILE* file = std::fopen(statPath, "r");
  if (file == nullptr) {
    return false;
  }

  // Aggregate line is first in practice, but scan in case of odd fixtures
  std::array<char, 512> lineBuf{};
  bool found = false;
  while (std::fgets(lineBuf.data(), static_cast<int>(lineBuf.size()), file) != nullptr) {
    if (parseAggregateCpuLine(lineBuf.data(), out)) {
      found = true;
      break;
    }
  }

  std::fclose(file);
  return found;
}

double computeBusyPercent(const CpuTimeCounters& before, const CpuTimeCounters& after) noexcept {
  const std::uint64_t TOTAL_BEFORE = before.total();
  const std::uint64_t TOTAL_AFTER = after.total();
  if (TOTAL_AFTER <= TOTAL_BEFORE) {
    return 0.0;
  }

  const std::uint64_t BUSY_BEFORE = before.busy();
  const std::uint64_t BUSY_AFTER = after.busy();
  if (BUSY_AFTER < BUSY_BEFORE) {
    return 0.0;
  }

  return static_cast<double>(BUSY_AFTER - BUSY_BEFORE) * 100.0 /
         static_cast<double>(TOTAL_AFTER - TOTAL_BEFORE);
}

} // namespace cpu

} // namespace vitals
