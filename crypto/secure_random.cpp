#include "crypto/secure_random.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace remit {
namespace crypto {

std::vector<unsigned char> randomBytes(size_t count) {
  std::vector<unsigned char> bytes(count);
  if (count == 0) return bytes;

  if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    char reason[256];
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
  }
  return bytes;
}

std::string randomHex(size_t count) {
  auto bytes = randomBytes(count);
  return toHex(bytes.data(), bytes.size());
}

std::string toHex(const unsigned char* data, size_t size) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

}  // namespace crypto
}  // namespace remit
