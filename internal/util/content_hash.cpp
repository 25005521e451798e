#include "content_hash.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mirrorsync::util {

ContentHasher::ContentHasher(const std::string& algorithm) : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");

  const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
  if (md == nullptr) throw std::invalid_argument("unsupported hash algorithm: " + algorithm);

  if (EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void ContentHasher::Update(const void* data, size_t size) {
  if (finished_) throw std::logic_error("hasher already finalized");
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string ContentHasher::FinalHex() {
  if (finished_) throw std::logic_error("hasher already finalized");

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finished_ = true;
  return HexEncode(out, out_len);
}

bool ContentHasher::IsSupported(const std::string& algorithm) {
  return !algorithm.empty() && EVP_get_digestbyname(algorithm.c_str()) != nullptr;
}

std::string HexEncode(const unsigned char* data, size_t len) {
  std::ostringstream o;
  o << std::hex << std::setfill('0');
  for (size_t i = 0; i < len; ++i) {
    o << std::setw(2) << static_cast<int>(data[i]);
  }
  return o.str();
}

bool HexEqualIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

} // namespace mirrorsync::util
