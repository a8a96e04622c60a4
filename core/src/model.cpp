#include "hexsplit/model.hpp"

#include <tuple>

namespace hexsplit {

bool operator==(const Chunk &lhs, const Chunk &rhs) {
    return std::tie(lhs.file_name, lhs.index, lhs.total, lhs.checksum, lhs.payload_encoded) ==
           std::tie(rhs.file_name, rhs.index, rhs.total, rhs.checksum, rhs.payload_encoded);
}

bool operator==(const ManifestEntry &lhs, const ManifestEntry &rhs) {
    return std::tie(lhs.chunk_file, lhs.index, lhs.total, lhs.checksum) ==
           std::tie(rhs.chunk_file, rhs.index, rhs.total, rhs.checksum);
}

bool operator==(const Manifest &lhs, const Manifest &rhs) {
    return std::tie(lhs.file_name, lhs.file_checksum, lhs.entries) ==
           std::tie(rhs.file_name, rhs.file_checksum, rhs.entries);
}

} // namespace hexsplit
