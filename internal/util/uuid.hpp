#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace docflow::util {

/*
  Random (version 4) UUIDs for lease ids and staging object names.

  Execution ids are NOT random, see execution_id.hpp.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase form.
std::string ToString(const UUID& id);

} // namespace docflow::util
