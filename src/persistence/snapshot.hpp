#pragma once

#include "storage/keyspace.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>

namespace memkv::persistence {

// ── Snapshot header constants ────────────────────────────────────────────────

static constexpr char kSnapshotMagic[] = "MKVS";          // 4 bytes (no NUL)
static constexpr std::size_t kSnapshotMagicSize = 4;
static constexpr uint16_t kSnapshotVersion = 1;
static constexpr std::size_t kSnapshotHeaderSize =
    kSnapshotMagicSize + sizeof(uint16_t) + sizeof(uint32_t);   // 10 bytes

// ── Snapshot load result ─────────────────────────────────────────────────────

struct SnapshotLoadResult {
    std::size_t entries_read    = 0;
    std::size_t entries_loaded  = 0;   // read minus those already expired
};

// ── Snapshot ─────────────────────────────────────────────────────────────────
//
// Point-in-time dump of a Keyspace.  Binary format:
//
//   [magic: "MKVS" (4B)][version: u16 LE = 1][entry_count: u32 LE]
//     [type: u8][expire_at_ms: i64 LE, -1 = none]
//     [key_length: u32 LE][key]
//     [payload]                                      × entry_count
//   [crc32: u32 LE]     // CRC of everything from magic through last payload
//
// Payload by type:
//   string     [len: u32 LE][bytes]
//   list, set  [count: u32 LE]([len: u32 LE][bytes]) × count
//   zset       [count: u32 LE]([len: u32 LE][member][score: f64 bits u64 LE]) × count
//
// Lists are written head to tail, sorted sets in ascending order.
// Atomic write: write to .tmp, fsync, then rename.
//
// Thread-safety: static methods, no mutable state.  The Keyspace must not be
// mutated during save() or load().

class Snapshot {
public:
    // Default snapshot filename.
    static constexpr const char* kFilename = "dump.mkv";

    // Save every live entry of `keyspace` atomically to `path`.
    [[nodiscard]] static std::error_code save(const std::filesystem::path& path,
                                              const Keyspace& keyspace);

    // Load a snapshot from `path` into `keyspace`.  Validates magic, version
    // and CRC32 before touching the keyspace; existing keys with the same
    // name are overwritten.
    [[nodiscard]] static std::error_code load(const std::filesystem::path& path,
                                              Keyspace& keyspace,
                                              SnapshotLoadResult& result);

    // Check if a snapshot file exists at `path`.
    [[nodiscard]] static bool exists(const std::filesystem::path& path);
};

} // namespace memkv::persistence
