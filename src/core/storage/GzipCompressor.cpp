#include "GzipCompressor.hpp"

#include <zlib.h>

#include <fstream>
#include <memory>
#include <vector>

#include "core/ArchiveError.hpp"

namespace dca {

namespace {

constexpr size_t kChunk = 1 << 16;

struct GzFileCloser {
  void operator()(gzFile_s* f) const { if (f) gzclose(f); }
};
using GzFilePtr = std::unique_ptr<gzFile_s, GzFileCloser>;

std::string gz_error(gzFile f) {
  int errnum = 0;
  const char* msg = gzerror(f, &errnum);
  return msg ? msg : "unknown zlib error";
}

}

void gzip_file(const std::string& srcPath, const std::string& dstPath) {
  std::ifstream in(srcPath, std::ios::binary);
  if (!in) throw ArchiveError(ErrorKind::kIoFailure, "Cannot open '" + srcPath + "'");

  GzFilePtr out(gzopen(dstPath.c_str(), "wb"));
  if (!out) throw ArchiveError(ErrorKind::kIoFailure, "Cannot create '" + dstPath + "'");

  std::vector<char> buf(kChunk);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in.gcount();
    if (n <= 0) break;
    if (gzwrite(out.get(), buf.data(), static_cast<unsigned>(n)) != static_cast<int>(n)) {
      throw ArchiveError(ErrorKind::kIoFailure,
                         "Compressing into '" + dstPath + "' failed: " + gz_error(out.get()));
    }
  }
  if (in.bad()) throw ArchiveError(ErrorKind::kIoFailure, "Failed reading '" + srcPath + "'");

  // gzclose flushes the deflate stream and trailer; its result is the only
  // proof the file is complete.
  const int rc = gzclose(out.release());
  if (rc != Z_OK) {
    throw ArchiveError(ErrorKind::kIoFailure,
                       "Closing '" + dstPath + "' failed (zlib " + std::to_string(rc) + ")");
  }
}

void gunzip_file(const std::string& srcPath, const std::string& dstPath) {
  GzFilePtr in(gzopen(srcPath.c_str(), "rb"));
  if (!in) throw ArchiveError(ErrorKind::kIoFailure, "Cannot open '" + srcPath + "'");

  std::ofstream out(dstPath, std::ios::binary | std::ios::trunc);
  if (!out) throw ArchiveError(ErrorKind::kIoFailure, "Cannot create '" + dstPath + "'");

  std::vector<char> buf(kChunk);
  for (;;) {
    const int n = gzread(in.get(), buf.data(), static_cast<unsigned>(buf.size()));
    if (n < 0) {
      throw ArchiveError(ErrorKind::kIoFailure,
                         "Decompressing '" + srcPath + "' failed: " + gz_error(in.get()));
    }
    if (n == 0) break;
    out.write(buf.data(), n);
  }
  out.flush();
  if (!out) throw ArchiveError(ErrorKind::kIoFailure, "Failed writing '" + dstPath + "'");
}

} // namespace dca
