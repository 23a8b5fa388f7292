#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chartsync::util {

/*
  Resources get a random RFC4122 v4 UUID as their internal row identity,
  and as logical id when created locally without one.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Lowercase 8-4-4-4-12 form.
std::string ToString(const UUID& id);

std::string GenerateUUIDString();

} // namespace chartsync::util
