#include "persistence/snapshot.hpp"
#include "persistence/crc32.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace memkv::persistence {

namespace {

// ── Little-endian serialisation helpers ──────────────────────────────────────

void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

void append_u16(std::vector<uint8_t>& buf, uint16_t v) {
    uint8_t b[2];
    b[0] = static_cast<uint8_t>(v);
    b[1] = static_cast<uint8_t>(v >> 8);
    buf.insert(buf.end(), b, b + 2);
}

void append_u32(std::vector<uint8_t>& buf, uint32_t v) {
    uint8_t b[4];
    b[0] = static_cast<uint8_t>(v);
    b[1] = static_cast<uint8_t>(v >> 8);
    b[2] = static_cast<uint8_t>(v >> 16);
    b[3] = static_cast<uint8_t>(v >> 24);
    buf.insert(buf.end(), b, b + 4);
}

void append_u64(std::vector<uint8_t>& buf, uint64_t v) {
    uint8_t b[8];
    for (int i = 0; i < 8; ++i) {
        b[i] = static_cast<uint8_t>(v >> (i * 8));
    }
    buf.insert(buf.end(), b, b + 8);
}

void append_string(std::vector<uint8_t>& buf, const std::string& s) {
    append_u32(buf, static_cast<uint32_t>(s.size()));
    append_raw(buf, s.data(), s.size());
}

void append_double(std::vector<uint8_t>& buf, double d) {
    uint64_t bits = 0;
    std::memcpy(&bits, &d, sizeof(bits));
    append_u64(buf, bits);
}

void write_u32_at(std::vector<uint8_t>& buf, std::size_t offset, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf[offset + static_cast<std::size_t>(i)] = static_cast<uint8_t>(v >> (i * 8));
    }
}

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) |
           (static_cast<uint16_t>(p[1]) << 8);
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t read_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    }
    return v;
}

// Bounds-checked cursor over the loaded file.  Every read returns false once
// the input is exhausted.
// Smallest encodings: an empty string element, and an entry with an empty
// key and an empty string value.
constexpr std::size_t kMinElementSize = 4;
constexpr std::size_t kMinEntrySize   = 1 + 8 + 4 + 4;

class Reader {
public:
    Reader(const uint8_t* p, const uint8_t* end) : p_(p), end_(end) {}

    bool u8(uint8_t& out) {
        if (end_ - p_ < 1) return false;
        out = *p_++;
        return true;
    }

    bool u32(uint32_t& out) {
        if (end_ - p_ < 4) return false;
        out = read_u32(p_);
        p_ += 4;
        return true;
    }

    bool u64(uint64_t& out) {
        if (end_ - p_ < 8) return false;
        out = read_u64(p_);
        p_ += 8;
        return true;
    }

    bool f64(double& out) {
        uint64_t bits = 0;
        if (!u64(bits)) return false;
        std::memcpy(&out, &bits, sizeof(out));
        return true;
    }

    bool string(std::string& out) {
        uint32_t len = 0;
        if (!u32(len)) return false;
        if (static_cast<std::size_t>(end_ - p_) < len) return false;
        out.assign(reinterpret_cast<const char*>(p_), len);
        p_ += len;
        return true;
    }

    [[nodiscard]] bool at_end() const noexcept { return p_ == end_; }

    // True if `count` records of at least `min_size` bytes could still fit.
    [[nodiscard]] bool can_hold(uint32_t count, std::size_t min_size) const noexcept {
        return static_cast<uint64_t>(count) * min_size <= static_cast<uint64_t>(end_ - p_);
    }

private:
    const uint8_t* p_;
    const uint8_t* end_;
};

void append_payload(std::vector<uint8_t>& buf, const Value& value) {
    std::visit(
        [&buf](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, StringValue>) {
                append_string(buf, v);
            } else if constexpr (std::is_same_v<T, ListValue> || std::is_same_v<T, SetValue>) {
                append_u32(buf, static_cast<uint32_t>(v.size()));
                for (const auto& element : v) {
                    append_string(buf, element);
                }
            } else if constexpr (std::is_same_v<T, SortedSet>) {
                append_u32(buf, static_cast<uint32_t>(v.size()));
                v.for_each([&buf](const std::string& member, double score) {
                    append_string(buf, member);
                    append_double(buf, score);
                });
            }
        },
        value);
}

bool read_payload(Reader& in, ValueType type, Value& out) {
    switch (type) {
        case ValueType::String: {
            std::string s;
            if (!in.string(s)) return false;
            out = std::move(s);
            return true;
        }
        case ValueType::List: {
            uint32_t count = 0;
            if (!in.u32(count)) return false;
            ListValue list;
            for (uint32_t i = 0; i < count; ++i) {
                std::string element;
                if (!in.string(element)) return false;
                list.push_back(std::move(element));
            }
            out = std::move(list);
            return true;
        }
        case ValueType::Set: {
            uint32_t count = 0;
            if (!in.u32(count) || !in.can_hold(count, kMinElementSize)) return false;
            SetValue set;
            set.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                std::string element;
                if (!in.string(element)) return false;
                set.insert(std::move(element));
            }
            out = std::move(set);
            return true;
        }
        case ValueType::SortedSet: {
            uint32_t count = 0;
            if (!in.u32(count)) return false;
            SortedSet zset;
            for (uint32_t i = 0; i < count; ++i) {
                std::string member;
                double score = 0;
                if (!in.string(member) || !in.f64(score) || score != score) return false;
                zset.insert_or_update(member, score);
            }
            out = std::move(zset);
            return true;
        }
    }
    return false;
}

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read exactly `len` bytes from fd into `buf`. Returns error_code on failure.
[[nodiscard]] std::error_code read_all(int fd, uint8_t* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        auto n = ::read(fd, buf + total, len - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);  // unexpected EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

struct LoadedEntry {
    std::string            key;
    Value                  value;
    std::optional<int64_t> expire_at_ms;
};

}  // namespace

// ── Snapshot::save ───────────────────────────────────────────────────────────

std::error_code Snapshot::save(const std::filesystem::path& path,
                               const Keyspace& keyspace) {
    std::vector<uint8_t> buf;
    buf.reserve(kSnapshotHeaderSize + keyspace.size() * 64 + 4);

    append_raw(buf, kSnapshotMagic, kSnapshotMagicSize);
    append_u16(buf, kSnapshotVersion);

    // Entry count is patched once the live entries have been counted.
    const std::size_t count_offset = buf.size();
    append_u32(buf, 0);

    uint32_t count = 0;
    keyspace.for_each_entry([&](const std::string& key, const Value& value,
                                std::optional<int64_t> expire_at_ms) {
        buf.push_back(static_cast<uint8_t>(type_of(value)));
        append_u64(buf, static_cast<uint64_t>(expire_at_ms.value_or(-1)));
        append_string(buf, key);
        append_payload(buf, value);
        ++count;
    });
    write_u32_at(buf, count_offset, count);

    // CRC32 of everything so far.
    uint32_t checksum = crc32(buf.data(), buf.size());
    append_u32(buf, checksum);

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("Snapshot: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    std::error_code cleanup_ec;
    auto ec = write_all(fd, buf.data(), buf.size());
    if (ec) {
        spdlog::error("Snapshot: write failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, cleanup_ec);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("Snapshot: fsync failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, cleanup_ec);
        return ec;
    }

    ::close(fd);

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("Snapshot: rename failed: {}", rename_ec.message());
        std::filesystem::remove(tmp_path, cleanup_ec);
        return rename_ec;
    }

    spdlog::info("Snapshot: saved {} keys ({} bytes) to {}",
                 count, buf.size(), path.string());
    return {};
}

// ── Snapshot::load ───────────────────────────────────────────────────────────

std::error_code Snapshot::load(const std::filesystem::path& path,
                               Keyspace& keyspace,
                               SnapshotLoadResult& result) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("Snapshot: failed to open {}: {}", path.string(),
                      ec.message());
        return ec;
    }

    auto file_size = ::lseek(fd, 0, SEEK_END);
    if (file_size < 0 || ::lseek(fd, 0, SEEK_SET) < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        ::close(fd);
        return ec;
    }

    // Minimum valid snapshot: header(10) + crc(4)
    static constexpr std::size_t kMinSize = kSnapshotHeaderSize + 4;

    if (static_cast<std::size_t>(file_size) < kMinSize) {
        ::close(fd);
        spdlog::error("Snapshot: file too small ({} bytes)", file_size);
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::vector<uint8_t> buf(static_cast<std::size_t>(file_size));
    auto ec = read_all(fd, buf.data(), buf.size());
    ::close(fd);
    if (ec) {
        spdlog::error("Snapshot: read failed: {}", ec.message());
        return ec;
    }

    if (std::memcmp(buf.data(), kSnapshotMagic, kSnapshotMagicSize) != 0) {
        spdlog::error("Snapshot: invalid magic");
        return std::make_error_code(std::errc::invalid_argument);
    }

    const uint16_t version = read_u16(buf.data() + kSnapshotMagicSize);
    if (version != kSnapshotVersion) {
        spdlog::error("Snapshot: unsupported version {}", version);
        return std::make_error_code(std::errc::invalid_argument);
    }

    // The CRC covers everything before the last four bytes; check it before
    // decoding so a damaged file never reaches the keyspace.
    const std::size_t data_len = buf.size() - 4;
    const uint32_t stored_crc   = read_u32(buf.data() + data_len);
    const uint32_t computed_crc = crc32(buf.data(), data_len);
    if (stored_crc != computed_crc) {
        spdlog::error("Snapshot: CRC mismatch (stored={:#010x}, computed={:#010x})",
                      stored_crc, computed_crc);
        return std::make_error_code(std::errc::invalid_argument);
    }

    const uint32_t entry_count = read_u32(buf.data() + kSnapshotMagicSize + 2);
    Reader in{buf.data() + kSnapshotHeaderSize, buf.data() + data_len};

    if (!in.can_hold(entry_count, kMinEntrySize)) {
        spdlog::error("Snapshot: entry count {} exceeds file size", entry_count);
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::vector<LoadedEntry> entries;
    entries.reserve(entry_count);

    for (uint32_t i = 0; i < entry_count; ++i) {
        uint8_t  type_tag = 0;
        uint64_t expire_raw = 0;
        LoadedEntry entry;

        if (!in.u8(type_tag) || !in.u64(expire_raw) || !in.string(entry.key)) {
            spdlog::error("Snapshot: truncated at entry {} header", i);
            return std::make_error_code(std::errc::invalid_argument);
        }
        if (type_tag > static_cast<uint8_t>(ValueType::SortedSet)) {
            spdlog::error("Snapshot: unknown value type {} at entry {}", type_tag, i);
            return std::make_error_code(std::errc::invalid_argument);
        }
        if (!read_payload(in, static_cast<ValueType>(type_tag), entry.value)) {
            spdlog::error("Snapshot: malformed payload at entry {}", i);
            return std::make_error_code(std::errc::invalid_argument);
        }

        const auto expire = static_cast<int64_t>(expire_raw);
        if (expire >= 0) {
            entry.expire_at_ms = expire;
        }
        entries.push_back(std::move(entry));
    }

    if (!in.at_end()) {
        spdlog::error("Snapshot: trailing bytes after {} entries", entry_count);
        return std::make_error_code(std::errc::invalid_argument);
    }

    result = SnapshotLoadResult{};
    result.entries_read = entries.size();
    for (auto& entry : entries) {
        if (is_empty_container(entry.value)) {
            continue;
        }
        if (keyspace.restore(entry.key, std::move(entry.value), entry.expire_at_ms)) {
            ++result.entries_loaded;
        }
    }

    spdlog::info("Snapshot: loaded {} of {} keys from {}",
                 result.entries_loaded, result.entries_read, path.string());
    return {};
}

// ── Snapshot::exists ─────────────────────────────────────────────────────────

bool Snapshot::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace memkv::persistence
