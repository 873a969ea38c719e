#pragma once
#include <memory>
#include <string>

struct archive;

namespace dca {

// Uncompressed POSIX (pax) tar writer on top of libarchive.
// Entries carry type, mode, size, mtime, uid and gid only, so the output is
// byte-stable for unchanged inputs.
class TarWriter {
public:
  explicit TarWriter(const std::string& path);
  TarWriter(const TarWriter&) = delete;
  TarWriter& operator=(const TarWriter&) = delete;

  // Adds `diskPath` under `entryName`. Directories are added with their
  // content, in sorted order. Symlinks are stored as links. The tar file
  // being written is never added to itself.
  void add(const std::string& diskPath, const std::string& entryName);

  // Flushes the trailer. The file is complete only after close() returns.
  void close();

private:
  void addOne(const std::string& diskPath, const std::string& entryName);
  [[noreturn]] void fail(const std::string& what) const;

  std::string path_;
  std::unique_ptr<struct archive, int (*)(struct archive*)> a_;
  bool closed_ = false;
};

// Stage 1 of the pipeline: every entry directly under `sourceDir` (recursing
// into subdirectories) into `tarPath`.
void pack_directory(const std::string& sourceDir, const std::string& tarPath);

} // namespace dca
