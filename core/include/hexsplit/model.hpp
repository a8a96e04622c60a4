#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hexsplit {

// Byte range of one partition of the source.
struct ChunkRange {
    std::uint32_t index;
    std::uint64_t offset;
    std::size_t size;
};

// One slice of the source as it travels: identity, self-reported checksum and the
// hex-encoded payload. The raw payload is HexCodec::decode(payload_encoded).
struct Chunk {
    std::string file_name;
    std::uint32_t index{0};
    std::uint32_t total{0};
    std::string checksum;
    std::string payload_encoded;
};

struct ManifestEntry {
    std::string chunk_file;
    std::uint32_t index{0};
    std::uint32_t total{0};
    std::string checksum;
};

// Owns the definitive order of the chunks. Its checksums are the trusted ones.
struct Manifest {
    std::string file_name;
    std::string file_checksum;
    std::vector<ManifestEntry> entries;
};

bool operator==(const Chunk &lhs, const Chunk &rhs);
bool operator==(const ManifestEntry &lhs, const ManifestEntry &rhs);
bool operator==(const Manifest &lhs, const Manifest &rhs);

} // namespace hexsplit
