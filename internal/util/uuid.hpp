#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace capacity::util {

/*
  UUID helpers

  Reservation ids are random RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace capacity::util
