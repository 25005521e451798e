#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace mirrorsync::util {

/*
  Incremental content digest over an OpenSSL EVP message digest.

  Catalog hashes are lower-case hex; "md5" is the archive default and any
  digest name known to EVP_get_digestbyname is accepted.
*/
class ContentHasher {
 public:
  explicit ContentHasher(const std::string& algorithm);

  void Update(const void* data, size_t size);

  // Finishes the digest; the hasher cannot be updated afterwards.
  std::string FinalHex();

  static bool IsSupported(const std::string& algorithm);

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
      EVP_MD_CTX_free(ctx);
    }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool                                    finished_ = false;
};

std::string HexEncode(const unsigned char* data, size_t len);

bool HexEqualIgnoreCase(std::string_view a, std::string_view b);

} // namespace mirrorsync::util
