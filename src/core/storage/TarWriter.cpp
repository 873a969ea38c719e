#include "TarWriter.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "core/ArchiveError.hpp"

namespace dca {

namespace fs = std::filesystem;

namespace {
struct EntryDeleter {
  void operator()(archive_entry* e) const { archive_entry_free(e); }
};

std::vector<std::string> sorted_children(const std::string& dir) {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  if (ec) {
    throw ArchiveError(ErrorKind::kIoFailure, "Cannot list '" + dir + "': " + ec.message());
  }
  std::sort(names.begin(), names.end());
  return names;
}
}

TarWriter::TarWriter(const std::string& path)
  : path_(path), a_(archive_write_new(), archive_write_free) {
  if (!a_) throw ArchiveError(ErrorKind::kIoFailure, "archive_write_new failed");
  if (archive_write_set_format_pax_restricted(a_.get()) != ARCHIVE_OK) fail("set format");
  if (archive_write_add_filter_none(a_.get()) != ARCHIVE_OK) fail("set filter");
  if (archive_write_open_filename(a_.get(), path_.c_str()) != ARCHIVE_OK) fail("open");
}

void TarWriter::fail(const std::string& what) const {
  const char* msg = a_ ? archive_error_string(a_.get()) : nullptr;
  throw ArchiveError(ErrorKind::kIoFailure,
                     "tar '" + path_ + "': " + what + " failed" + (msg ? std::string(": ") + msg : ""));
}

void TarWriter::add(const std::string& diskPath, const std::string& entryName) {
  // A target inside the source would otherwise pack its own partial output.
  std::error_code ec;
  if (fs::equivalent(diskPath, path_, ec)) {
    spdlog::debug("Skipping the archive being written '{}'", diskPath);
    return;
  }
  addOne(diskPath, entryName);

  if (fs::is_directory(fs::symlink_status(diskPath, ec))) {
    for (const auto& name : sorted_children(diskPath)) {
      add(diskPath + "/" + name, entryName + "/" + name);
    }
  }
}

void TarWriter::addOne(const std::string& diskPath, const std::string& entryName) {
  struct stat st{};
  if (::lstat(diskPath.c_str(), &st) != 0) {
    throw ArchiveError(ErrorKind::kIoFailure, "Cannot stat '" + diskPath + "'");
  }

  std::unique_ptr<archive_entry, EntryDeleter> e(archive_entry_new());
  archive_entry_set_pathname(e.get(), entryName.c_str());
  archive_entry_set_perm(e.get(), st.st_mode & 07777);
  archive_entry_set_uid(e.get(), st.st_uid);
  archive_entry_set_gid(e.get(), st.st_gid);
  archive_entry_set_mtime(e.get(), st.st_mtime, 0);

  if (S_ISREG(st.st_mode)) {
    archive_entry_set_filetype(e.get(), AE_IFREG);
    archive_entry_set_size(e.get(), st.st_size);
  } else if (S_ISDIR(st.st_mode)) {
    archive_entry_set_filetype(e.get(), AE_IFDIR);
    archive_entry_set_size(e.get(), 0);
  } else if (S_ISLNK(st.st_mode)) {
    std::vector<char> target(static_cast<size_t>(st.st_size) + 1, '\0');
    ssize_t n = ::readlink(diskPath.c_str(), target.data(), target.size() - 1);
    if (n < 0) throw ArchiveError(ErrorKind::kIoFailure, "Cannot read link '" + diskPath + "'");
    target[static_cast<size_t>(n)] = '\0';
    archive_entry_set_filetype(e.get(), AE_IFLNK);
    archive_entry_set_symlink(e.get(), target.data());
    archive_entry_set_size(e.get(), 0);
  } else {
    spdlog::warn("Skipping special file '{}'", diskPath);
    return;
  }

  if (archive_write_header(a_.get(), e.get()) < ARCHIVE_WARN) fail("header for '" + entryName + "'");

  if (!S_ISREG(st.st_mode)) return;

  std::ifstream in(diskPath, std::ios::binary);
  if (!in) throw ArchiveError(ErrorKind::kIoFailure, "Cannot open '" + diskPath + "'");
  std::vector<char> buf(1 << 16);
  int64_t written = 0;
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in.gcount();
    if (n <= 0) break;
    if (archive_write_data(a_.get(), buf.data(), static_cast<size_t>(n)) < 0) {
      fail("data for '" + entryName + "'");
    }
    written += n;
  }
  if (in.bad() || written != st.st_size) {
    throw ArchiveError(ErrorKind::kIoFailure, "'" + diskPath + "' changed while being archived");
  }
}

void TarWriter::close() {
  if (closed_) return;
  if (archive_write_close(a_.get()) != ARCHIVE_OK) fail("close");
  closed_ = true;
}

void pack_directory(const std::string& sourceDir, const std::string& tarPath) {
  std::string prefix = sourceDir;
  while (!prefix.empty() && prefix.front() == '/') prefix.erase(0, 1);

  TarWriter tar(tarPath);
  for (const auto& name : sorted_children(sourceDir)) {
    tar.add(sourceDir + "/" + name, prefix.empty() ? name : prefix + "/" + name);
  }
  tar.close();
}

} // namespace dca
