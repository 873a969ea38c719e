#include "Checksum.hpp"

#include <openssl/evp.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "core/ArchiveError.hpp"

namespace dca {

static std::string to_hex(const unsigned char* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

namespace {
struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}

Checksum md5_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ArchiveError(ErrorKind::kIoFailure, "Cannot open '" + path + "' for hashing");

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw ArchiveError(ErrorKind::kIoFailure, "EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw ArchiveError(ErrorKind::kIoFailure, "EVP_DigestInit_ex failed");
  }

  std::vector<char> buf(1 << 16);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
      throw ArchiveError(ErrorKind::kIoFailure, "EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) throw ArchiveError(ErrorKind::kIoFailure, "Failed reading '" + path + "'");

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int outLen = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1) {
    throw ArchiveError(ErrorKind::kIoFailure, "EVP_DigestFinal_ex failed");
  }

  return Checksum{to_hex(out, outLen), std::filesystem::path(path).filename().string()};
}

} // namespace dca
