#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/io.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kBufferSize = 64 * 1024;

[[noreturn]] void ThrowErrno(const std::string& what) {
  throw std::system_error(errno, std::system_category(), what);
}

kj::AutoCloseFd Open(const std::string& path, int flags) {
  int fd;
  while ((fd = open(path.c_str(), flags | O_CLOEXEC, 0600)) == -1 &&  // NOLINT
         errno == EINTR) {
  }
  if (fd == -1) ThrowErrno("open " + path);
  return kj::AutoCloseFd(fd);
}

}  // namespace

namespace util {

std::string File::ReadAll(const std::string& path) {
  kj::AutoCloseFd fd = Open(path, O_RDONLY);
  std::string content;
  std::vector<char> buf(kBufferSize);
  while (true) {
    ssize_t amount = read(fd, buf.data(), buf.size());
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) ThrowErrno("read " + path);
    if (amount == 0) break;
    content.append(buf.data(), amount);
  }
  return content;
}

void File::WriteAll(const std::string& path, const std::string& content) {
  MakeDirs(BaseDir(path));
  std::string tmp = path + ".XXXXXX";
  std::vector<char> name(tmp.begin(), tmp.end());
  name.push_back('\0');
  kj::AutoCloseFd fd(mkostemp(name.data(), O_CLOEXEC));
  if (fd.get() == -1) ThrowErrno("mkostemp " + tmp);
  tmp = name.data();
  auto error = kj::runCatchingExceptions([&]() {
    kj::FdOutputStream out(fd.get());
    out.write(content.data(), content.size());
  });
  KJ_IF_MAYBE(exc, error) {
    unlink(tmp.c_str());
    throw std::system_error(EIO, std::system_category(),
                            "write " + path + ": " +
                                exc->getDescription().cStr());
  }
  if (fchmod(fd, 0644) == -1 || rename(tmp.c_str(), path.c_str()) == -1) {
    int err = errno;
    unlink(tmp.c_str());
    throw std::system_error(err, std::system_category(), "rename " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    std::string dir = path.substr(0, pos);
    if (mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      ThrowErrno("mkdir " + dir);
    }
  }
}

void File::RemoveTree(const std::string& path) {
  int ret = nftw(path.c_str(),
                 [](const char* fpath, const struct stat* sb, int typeflags,
                    struct FTW* ftwbuf) { return remove(fpath); },
                 64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT);
  if (ret == -1) ThrowErrno("removetree " + path);
}

void File::ClearDirectory(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) ThrowErrno("opendir " + path);
  KJ_DEFER(closedir(dir));
  std::vector<std::string> entries;
  errno = 0;
  while (struct dirent* entry = readdir(dir)) {  // NOLINT
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    entries.push_back(JoinPath(path, name));
  }
  if (errno != 0) ThrowErrno("readdir " + path);
  for (const std::string& entry : entries) RemoveTree(entry);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr)
    return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return "";
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (lstat(path.c_str(), &st) != 0) return -1;
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string tmp = File::JoinPath(base, "XXXXXX");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) ThrowErrno("mkdtemp " + tmp);
  path_ = data.data();
}

void TempDir::Keep() { keep_ = true; }

const std::string& TempDir::Path() const { return path_; }

TempDir& TempDir::operator=(TempDir&& other) noexcept {
  if (this == &other) return *this;
  Remove();
  path_ = std::move(other.path_);
  keep_ = other.keep_;
  moved_ = other.moved_;
  other.moved_ = true;
  return *this;
}

void TempDir::Remove() noexcept {
  if (keep_ || moved_ || path_.empty()) return;
  auto error = kj::runCatchingExceptions([&]() { File::RemoveTree(path_); });
  KJ_IF_MAYBE(exc, error) {
    KJ_LOG(WARNING, "Could not remove " + path_, exc->getDescription());
  }
}

TempDir::~TempDir() { Remove(); }

}  // namespace util
