#ifndef VITALS_HELPERS_FILES_HPP
#define VITALS_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Raw node reader for sysfs/procfs virtual filesystem nodes.
 *
 * Every failure mode (missing path, permission denied, device removed,
 * unparseable content) collapses to an absent value. Nothing here throws.
 *
 * @note RT-SAFE: readFileToBuffer() and readNodeUint64() use C-style I/O with
 *       fixed-size buffers. Text and directory helpers allocate.
 */

#include "src/helpers/inc/Strings.hpp"

#include <dirent.h>   // opendir, readdir, closedir
#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, close

#include <algorithm> // std::sort
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vitals {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for text node reads.
inline constexpr std::size_t FILE_READ_BUFFER_SIZE = 256;

/// Size for small integer node reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read a whole node into a fixed buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @param len Set to the number of bytes read (excluding null terminator).
 * @return true if the node was opened and read to EOF within bufSize - 1 bytes.
 * @note RT-SAFE: Uses open/read/close, no heap allocation.
 *
 * An empty node is a successful read with len == 0. A read error (EISDIR,
 * EIO from a removed device) or content that does not fit fails; the node is
 * never silently truncated. Always null-terminates.
 */
[[nodiscard]] inline bool readFileToBuffer(const char* path, char* buf, std::size_t bufSize,
                                           std::size_t& len) noexcept {
  len = 0;
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return false;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  bool ok = true;
  while (true) {
    if (len == bufSize - 1) {
      // Buffer full: any further byte means the node is oversized
      char extra = 0;
      const ssize_t N = ::read(FD, &extra, 1);
      ok = (N == 0);
      break;
    }
    const ssize_t N = ::read(FD, buf + len, bufSize - 1 - len);
    if (N == 0) {
      break;
    }
    if (N < 0) {
      ok = false;
      break;
    }
    len += static_cast<std::size_t>(N);
  }

  ::close(FD);
  if (!ok) {
    len = 0;
  }
  buf[len] = '\0';
  return ok;
}

/**
 * @brief Read a node and parse it as an unsigned 64-bit integer.
 * @param path Node path.
 * @return Parsed value, or std::nullopt if the node is missing, unreadable,
 *         oversized, or its trimmed content is not a non-negative decimal integer.
 * @note RT-SAFE: No heap allocation.
 */
[[nodiscard]] inline std::optional<std::uint64_t> readNodeUint64(const char* path) noexcept {
  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  std::size_t len = 0;
  if (!readFileToBuffer(path, buf.data(), buf.size(), len)) {
    return std::nullopt;
  }
  return vitals::helpers::strings::parseUint64(
      vitals::helpers::strings::trim(std::string_view(buf.data(), len)));
}

/// @overload
[[nodiscard]] inline std::optional<std::uint64_t>
readNodeUint64(const std::string& path) noexcept {
  return readNodeUint64(path.c_str());
}

/**
 * @brief Read a whole node as trimmed text.
 * @param path Node path.
 * @return Trimmed content (possibly empty), or std::nullopt if the node
 *         cannot be opened or a read fails.
 * @note NOT RT-SAFE: Grows a std::string.
 */
[[nodiscard]] inline std::optional<std::string> readNodeText(const std::string& path) {
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return std::nullopt;
  }

  std::string content;
  std::array<char, FILE_READ_BUFFER_SIZE> chunk{};
  bool ok = true;
  while (true) {
    const ssize_t N = ::read(FD, chunk.data(), chunk.size());
    if (N == 0) {
      break;
    }
    if (N < 0) {
      ok = false;
      break;
    }
    content.append(chunk.data(), static_cast<std::size_t>(N));
  }
  ::close(FD);

  if (!ok) {
    return std::nullopt;
  }
  return std::string(vitals::helpers::strings::trim(content));
}

/* ----------------------------- Directories ----------------------------- */

/**
 * @brief List directory entries in lexicographic order.
 * @param path Directory to list.
 * @return Entry names except "." and ".."; empty on error.
 * @note NOT RT-SAFE: Allocates.
 *
 * Sorting makes "first match wins" scans independent of readdir() order.
 */
[[nodiscard]] inline std::vector<std::string> listDirSorted(const std::string& path) {
  std::vector<std::string> names;

  DIR* dir = ::opendir(path.c_str());
  if (dir == nullptr) {
    return names;
  }

  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    const std::string_view NAME(entry->d_name);
    if (NAME == "." || NAME == "..") {
      continue;
    }
    names.emplace_back(NAME);
  }
  ::closedir(dir);

  std::sort(names.begin(), names.end());
  return names;
}

} // namespace files
} // namespace helpers
} // namespace vitals

#endif // VITALS_HELPERS_FILES_HPP
