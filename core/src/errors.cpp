#include "hexsplit/errors.hpp"

#include <utility>

namespace hexsplit {

const char *to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::invalid_input:
        return "invalid input";
    case ErrorKind::manifest_malformed:
        return "manifest malformed";
    case ErrorKind::chunk_missing:
        return "chunk missing";
    case ErrorKind::chunk_identity_mismatch:
        return "chunk identity mismatch";
    case ErrorKind::decode_error:
        return "decode error";
    case ErrorKind::chunk_checksum_mismatch:
        return "chunk checksum mismatch";
    case ErrorKind::whole_file_checksum_mismatch:
        return "whole file checksum mismatch";
    case ErrorKind::storage_error:
        return "storage error";
    }
    return "unknown error";
}

bool is_corruption(ErrorKind kind) noexcept {
    return kind == ErrorKind::chunk_checksum_mismatch ||
           kind == ErrorKind::whole_file_checksum_mismatch;
}

Error::Error(ErrorKind kind, const std::string &msg, std::string file_name,
             std::uint32_t chunk_number)
    : std::runtime_error(msg), kind_(kind), file_name_(std::move(file_name)),
      chunk_number_(chunk_number) {}

} // namespace hexsplit
