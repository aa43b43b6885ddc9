#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace negotiation::util {

/*
  UUID helpers

  Negotiation, offer and agreement ids are RFC4122 v4 UUIDs in canonical
  string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// shorthand for ToString(GenerateUUID())
std::string GenerateId();

} // namespace negotiation::util
