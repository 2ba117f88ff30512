#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace artscan::util {

// Random (version 4) identifier; names stored scan images.
using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase hex form.
std::string ToString(const UUID& id);

} // namespace artscan::util
