#pragma once
#include <string>

namespace dca {

// MD5 of a file's bytes on disk, in `md5sum` form: "<hex> <basename>".
struct Checksum {
  std::string hex;
  std::string fileName;

  std::string toString() const { return hex + " " + fileName; }
};

// Streams the file through OpenSSL EVP. Throws ArchiveError(kIoFailure).
Checksum md5_file(const std::string& path);

} // namespace dca
