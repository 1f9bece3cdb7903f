#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Called once per chunk read, in order. A chunk is never empty.
  using ChunkReceiver = std::function<void(const char* data, size_t size)>;

  // Reads the file specified by path in chunks.
  static void Read(const std::string& path,
                   const ChunkReceiver& chunk_receiver);

  // Reads at most max_bytes of the given file. If the file is longer and
  // truncated is not null, *truncated is set to true.
  static std::string ReadAll(const std::string& path, size_t max_bytes,
                             bool* truncated = nullptr);

  // Atomically replaces (or creates) path with the given contents. If the
  // file exists and overwrite is false, the file is left untouched when
  // exist_ok is true and file_exists is thrown otherwise.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false, bool exist_ok = true);

  // Creates the directory and all its missing parents. Throws if path exists
  // and is not a directory.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree. Nothing happens if path does not exist.
  static void RemoveTree(const std::string& path);

  // Joins two paths. An absolute second path is returned as is.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Directory part of a path: "." if there is none.
  static std::string BaseDir(const std::string& path);

  static bool Exists(const std::string& path);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
