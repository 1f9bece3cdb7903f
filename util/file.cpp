#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <vector>

#include "glog/logging.h"

namespace {

const constexpr char kPathSeparator = '/';

// Closes the descriptor when going out of scope.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ != -1) close(fd_);
  }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int Get() const { return fd_; }
  // Closes now, returning errno on failure and 0 otherwise.
  int Close() {
    int fd = fd_;
    fd_ = -1;
    return close(fd) == -1 ? errno : 0;
  }

 private:
  int fd_;
};

[[noreturn]] void Fail(int error, const std::string& what) {
  if (error == ENOENT) throw util::file_not_found(what);
  if (error == EEXIST) throw util::file_exists(what);
  throw std::system_error(error, std::system_category(), what);
}

// Writes contents to a new file next to path, and returns its name.
std::string WriteTemporary(const std::string& path,
                           const std::string& contents) {
  std::vector<char> name(path.begin(), path.end());
  const char suffix[] = ".XXXXXX";
  name.insert(name.end(), suffix, suffix + sizeof(suffix));
  ScopedFd fd(mkostemp(name.data(), O_CLOEXEC));
  if (fd.Get() == -1) Fail(errno, "create temporary file for " + path);
  std::string temp(name.data());

  const char* data = contents.data();
  size_t left = contents.size();
  while (left > 0) {
    ssize_t written = write(fd.Get(), data, left);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      unlink(temp.c_str());
      Fail(error, "write " + temp);
    }
    data += written;
    left -= written;
  }
  int error = fd.Close();
  if (error) {
    unlink(temp.c_str());
    Fail(error, "close " + temp);
  }
  return temp;
}

}  // namespace

namespace util {

void File::Read(const std::string& path,
                const File::ChunkReceiver& chunk_receiver) {
  ScopedFd fd(open(path.c_str(), O_CLOEXEC | O_RDONLY));
  if (fd.Get() == -1) Fail(errno, "read " + path);
  std::unique_ptr<char[]> buf(new char[kChunkSize]);
  while (true) {
    ssize_t amount = read(fd.Get(), buf.get(), kChunkSize);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) Fail(errno, "read " + path);
    if (amount == 0) break;
    chunk_receiver(buf.get(), amount);
  }
  int error = fd.Close();
  if (error) Fail(error, "close " + path);
}

std::string File::ReadAll(const std::string& path, size_t max_bytes,
                          bool* truncated) {
  std::string contents;
  bool cut = false;
  Read(path, [&contents, &cut, max_bytes](const char* data, size_t size) {
    size_t take = std::min(size, max_bytes - contents.size());
    if (take < size) cut = true;
    contents.append(data, take);
  });
  if (truncated) *truncated = cut;
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite, bool exist_ok) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Exists(path)) {
    if (exist_ok) return;
    Fail(EEXIST, "write " + path);
  }
  std::string temp = WriteTemporary(path, contents);
  if (overwrite) {
    if (rename(temp.c_str(), path.c_str()) == -1) {
      int error = errno;
      unlink(temp.c_str());
      Fail(error, "rename " + temp);
    }
    return;
  }
  // link fails instead of replacing a file created in the meantime.
  int error = link(temp.c_str(), path.c_str()) == -1 ? errno : 0;
  unlink(temp.c_str());
  if (error == EEXIST && exist_ok) return;
  if (error) Fail(error, "link " + path);
}

void File::MakeDirs(const std::string& path) {
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find(kPathSeparator, pos + 1);
    std::string dir = path.substr(0, pos);
    if (mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      throw std::system_error(errno, std::system_category(), "mkdir " + dir);
    }
  }
  struct stat info {};
  if (stat(path.c_str(), &info) == -1 || !S_ISDIR(info.st_mode)) {
    throw std::system_error(ENOTDIR, std::system_category(), "mkdir " + path);
  }
}

void File::RemoveTree(const std::string& path) {
  if (!Exists(path)) return;
  auto remove_entry = [](const char* entry, const struct stat* /*info*/,
                         int /*type*/, struct FTW* /*ftw*/) {
    return remove(entry);
  };
  if (nftw(path.c_str(), remove_entry, 64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) ==
      -1) {
    throw std::system_error(errno, std::system_category(),
                            "remove tree " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && second[0] == kPathSeparator) return second;
  if (first.empty()) return second;
  return first + kPathSeparator + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.rfind(kPathSeparator);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return std::string(1, kPathSeparator);
  return path.substr(0, pos);
}

bool File::Exists(const std::string& path) {
  struct stat info {};
  return stat(path.c_str(), &info) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string pattern = File::JoinPath(base, "XXXXXX");
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');
  if (mkdtemp(name.data()) == nullptr) {
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
  }
  path_ = name.data();
}

void TempDir::Keep() { keep_ = true; }

const std::string& TempDir::Path() const { return path_; }

TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
