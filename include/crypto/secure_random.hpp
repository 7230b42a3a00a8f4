#ifndef SECURE_RANDOM_HPP_
#define SECURE_RANDOM_HPP_

#include <cstddef>
#include <string>
#include <vector>

namespace remit {
namespace crypto {

/**
 * Bytes from the OpenSSL CSPRNG. Throws std::runtime_error if the generator
 * is not seeded.
 */
std::vector<unsigned char> randomBytes(size_t count);

/**
 * Lowercase hex encoding of `count` random bytes (2 * count characters).
 */
std::string randomHex(size_t count);

std::string toHex(const unsigned char* data, size_t size);

}  // namespace crypto
}  // namespace remit

#endif  // SECURE_RANDOM_HPP_
