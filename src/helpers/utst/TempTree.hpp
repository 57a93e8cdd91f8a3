#ifndef VITALS_HELPERS_TEMP_TREE_HPP
#define VITALS_HELPERS_TEMP_TREE_HPP
/**
 * @file TempTree.hpp
 * @brief Scratch directory for building fake sysfs/procfs trees in tests.
 */

#include <stdlib.h> // mkdtemp

#include <filesystem> // std::filesystem
#include <fstream>    // std::ofstream
#include <string>     // std::string
#include <system_error>

namespace vitals {
namespace test {

/**
 * @brief Temporary directory removed on destruction.
 */
class TempTree {
public:
  TempTree() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "vitals-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) != nullptr) {
      root_ = tmpl;
    }
  }

  ~TempTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  /// Absolute path of rel under the tree.
  [[nodiscard]] std::string path(const std::string& rel = "") const {
    return rel.empty() ? root_.string() : (root_ / rel).string();
  }

  /// Write content to rel, creating parent directories.
  void write(const std::string& rel, const std::string& content) const {
    const std::filesystem::path FULL = root_ / rel;
    std::filesystem::create_directories(FULL.parent_path());
    std::ofstream out(FULL, std::ios::binary | std::ios::trunc);
    out << content;
  }

  /// Create directory rel (and parents).
  void mkdir(const std::string& rel) const { std::filesystem::create_directories(root_ / rel); }

  [[nodiscard]] bool valid() const noexcept { return !root_.empty(); }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace vitals

#endif // VITALS_HELPERS_TEMP_TREE_HPP
