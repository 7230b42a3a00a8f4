#include "crypto/credential_hasher.hpp"
#include "crypto/secure_random.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace remit {
namespace crypto {

namespace {

constexpr const char* kScheme = "sha256";
constexpr size_t kSaltBytes = 16;

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

std::string CredentialHasher::hash(const std::string& secret) {
  const std::string salt = randomHex(kSaltBytes);
  return std::string(kScheme) + "$" + salt + "$" + digestHex(salt, secret);
}

bool CredentialHasher::verify(const std::string& secret, const std::string& encoded) {
  const auto first = encoded.find('$');
  if (first == std::string::npos || encoded.compare(0, first, kScheme) != 0) {
    return false;
  }
  const auto second = encoded.find('$', first + 1);
  if (second == std::string::npos) return false;

  const std::string salt = encoded.substr(first + 1, second - first - 1);
  const std::string expected = encoded.substr(second + 1);
  const std::string actual = digestHex(salt, secret);
  if (actual.size() != expected.size()) return false;

  return CRYPTO_memcmp(actual.data(), expected.data(), actual.size()) == 0;
}

std::string CredentialHasher::digestHex(const std::string& salt_hex, const std::string& secret) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), salt_hex.data(), salt_hex.size()) != 1 ||
      EVP_DigestUpdate(ctx.get(), secret.data(), secret.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return toHex(digest, digest_len);
}

}  // namespace crypto
}  // namespace remit
