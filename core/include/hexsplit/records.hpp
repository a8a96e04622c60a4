#pragma once

#include "hexsplit/model.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace hexsplit {

// JSON shape of the manifest and chunk records. Field names are fixed:
//   manifest: file_name, file_checksum, chunks[{chunk_file, chunk_number, total_chunks,
//             chunk_checksum}]
//   chunk:    file_name, chunk_number, total_chunks, chunk_checksum, chunk_data
nlohmann::json manifest_to_json(const Manifest &manifest);

nlohmann::json chunk_to_json(const Chunk &chunk);

// Every field is required. Throws ManifestMalformed.
Manifest manifest_from_json(const nlohmann::json &json);

// Every field is required. Throws DecodeError.
Chunk chunk_from_json(const nlohmann::json &json);

// Four-space indented text, as written to disk.
std::string dump_record(const nlohmann::json &json);

Manifest parse_manifest(const std::string &text);

Chunk parse_chunk(const std::string &text);

} // namespace hexsplit
