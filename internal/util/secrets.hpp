#pragma once

#include <cstddef>
#include <string>

namespace mirrorsync::util {

// Hex-encoded secret drawn from the OpenSSL CSPRNG. Throws on RNG failure.
std::string RandomToken(size_t bytes = 32);

// Human-typable code over an alphabet without 0/O/1/I lookalikes.
std::string RandomPairingCode(size_t length = 8);

// Constant-time comparison for credentials and admin tokens.
bool SecretEquals(const std::string& a, const std::string& b);

} // namespace mirrorsync::util
