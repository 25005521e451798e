#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace mirrorsync::util {

/*
  UUID helpers

  Mirror identifiers are canonical lower-case RFC4122 v4 strings.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewMirrorId() {
  return ToString(GenerateUUID());
}

} // namespace mirrorsync::util
