#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace hexsplit {

enum class ErrorKind {
    invalid_input,
    manifest_malformed,
    chunk_missing,
    chunk_identity_mismatch,
    decode_error,
    chunk_checksum_mismatch,
    whole_file_checksum_mismatch,
    storage_error,
};

const char *to_string(ErrorKind kind) noexcept;

// Checksum mismatches mean the data changed after it was split.
bool is_corruption(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string &msg, std::string file_name = {},
          std::uint32_t chunk_number = 0);

    ErrorKind kind() const noexcept { return kind_; }

    const std::string &file_name() const noexcept { return file_name_; }

    // 0 when the error is not about a single chunk.
    std::uint32_t chunk_number() const noexcept { return chunk_number_; }

  private:
    ErrorKind kind_;
    std::string file_name_;
    std::uint32_t chunk_number_;
};

class InvalidInput : public Error {
  public:
    explicit InvalidInput(const std::string &msg) : Error(ErrorKind::invalid_input, msg) {}
};

class ManifestMalformed : public Error {
  public:
    ManifestMalformed(const std::string &msg, std::string file_name = {},
                      std::uint32_t chunk_number = 0)
        : Error(ErrorKind::manifest_malformed, msg, std::move(file_name), chunk_number) {}
};

class ChunkMissing : public Error {
  public:
    ChunkMissing(const std::string &msg, std::string file_name, std::uint32_t chunk_number)
        : Error(ErrorKind::chunk_missing, msg, std::move(file_name), chunk_number) {}
};

class ChunkIdentityMismatch : public Error {
  public:
    ChunkIdentityMismatch(const std::string &msg, std::string file_name,
                          std::uint32_t chunk_number)
        : Error(ErrorKind::chunk_identity_mismatch, msg, std::move(file_name), chunk_number) {}
};

class DecodeError : public Error {
  public:
    DecodeError(const std::string &msg, std::string file_name = {},
                std::uint32_t chunk_number = 0)
        : Error(ErrorKind::decode_error, msg, std::move(file_name), chunk_number) {}
};

class ChunkChecksumMismatch : public Error {
  public:
    ChunkChecksumMismatch(const std::string &msg, std::string file_name,
                          std::uint32_t chunk_number)
        : Error(ErrorKind::chunk_checksum_mismatch, msg, std::move(file_name), chunk_number) {}
};

class WholeFileChecksumMismatch : public Error {
  public:
    WholeFileChecksumMismatch(const std::string &msg, std::string file_name)
        : Error(ErrorKind::whole_file_checksum_mismatch, msg, std::move(file_name)) {}
};

class StorageError : public Error {
  public:
    explicit StorageError(const std::string &msg) : Error(ErrorKind::storage_error, msg) {}
};

} // namespace hexsplit
