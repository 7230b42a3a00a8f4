#ifndef CREDENTIAL_HASHER_HPP_
#define CREDENTIAL_HASHER_HPP_

#include <string>

namespace remit {
namespace crypto {

/**
 * Salted SHA-256 credential verifier.
 * Encoded form: "sha256$<salt hex>$<digest hex>" where digest = SHA256(salt || secret).
 */
class CredentialHasher {
 public:
  static std::string hash(const std::string& secret);

  /**
   * Constant-time comparison of the recomputed digest. Malformed verifiers
   * never match.
   */
  static bool verify(const std::string& secret, const std::string& encoded);

 private:
  static std::string digestHex(const std::string& salt_hex, const std::string& secret);
};

}  // namespace crypto
}  // namespace remit

#endif  // CREDENTIAL_HASHER_HPP_
