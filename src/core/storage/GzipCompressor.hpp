#pragma once
#include <string>

namespace dca {

// Streams `srcPath` through zlib into a gzip file at `dstPath`.
// Throws ArchiveError(kIoFailure).
void gzip_file(const std::string& srcPath, const std::string& dstPath);

// Inverse of gzip_file, used to verify a compressed payload.
void gunzip_file(const std::string& srcPath, const std::string& dstPath);

} // namespace dca
