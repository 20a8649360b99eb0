#pragma once

#include <cstddef>
#include <cstdint>

namespace crock {

// Fill buf from /dev/urandom, falling back to a random_device-seeded
// mt19937_64 when the device is unavailable.
void fill_random_bytes(uint8_t* buf, size_t len);

} // namespace crock
