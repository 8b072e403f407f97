#pragma once

#include <cstddef>
#include <cstdint>

namespace memkv::persistence {

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

} // namespace memkv::persistence
