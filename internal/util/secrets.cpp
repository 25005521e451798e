#include "secrets.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <string_view>
#include <vector>

#include "content_hash.hpp"

namespace mirrorsync::util {

namespace {

constexpr std::string_view kCodeAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

void FillRandom(std::vector<unsigned char>& buf) {
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

} // namespace

std::string RandomToken(size_t bytes) {
  std::vector<unsigned char> buf(bytes);
  FillRandom(buf);
  return HexEncode(buf.data(), buf.size());
}

std::string RandomPairingCode(size_t length) {
  // alphabet size is 32, so masking keeps the distribution uniform
  static_assert(kCodeAlphabet.size() == 32);

  std::vector<unsigned char> buf(length);
  FillRandom(buf);

  std::string code;
  code.reserve(length);
  for (unsigned char b : buf) {
    code.push_back(kCodeAlphabet[b & 0x1F]);
  }
  return code;
}

bool SecretEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace mirrorsync::util
