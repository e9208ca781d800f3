#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <kj/common.h>
#include <cstdint>
#include <string>

namespace util {

// Filesystem helpers. Failures are reported as std::system_error.
class File {
 public:
  static std::string ReadAll(const std::string& path);

  // Replaces the content of path atomically, creating the missing parent
  // directories.
  static void WriteAll(const std::string& path, const std::string& content);

  // Creates path and all its missing parents.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree. Does not follow symlinks or cross mount points.
  static void RemoveTree(const std::string& path);

  // Removes everything inside a directory, keeping the directory itself.
  static void ClearDirectory(const std::string& path);

  // Joins two paths. An absolute second path is returned as is.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  static std::string BaseDir(const std::string& path);
  static std::string BaseName(const std::string& path);

  // Returns a negative number if the file does not exist.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a private temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);

  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  // Removes the folder currently owned, unless kept.
  TempDir& operator=(TempDir&& other) noexcept;
  KJ_DISALLOW_COPY(TempDir);

 private:
  void Remove() noexcept;

  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
