#include "healrun/common/digest.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cstdio>

namespace healrun::common {

Result<std::string> sha256_hex(const std::string &data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  unsigned int hash_len = 0;

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    return Result<std::string>::failure("EVP_MD_CTX_new failed");
  }
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok || hash_len != SHA256_DIGEST_LENGTH) {
    return Result<std::string>::failure("sha256 digest failed");
  }

  std::string out;
  out.reserve(hash_len * 2);
  char buf[3];
  for (unsigned int i = 0; i < hash_len; ++i) {
    std::snprintf(buf, sizeof(buf), "%02x", hash[i]);
    out += buf;
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace healrun::common
