#include "hexsplit/records.hpp"

#include "hexsplit/errors.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace hexsplit {

namespace {

using json = nlohmann::json;

template <typename ErrorT>
const json &require(const json &object, const char *field) {
    if (!object.is_object()) {
        throw ErrorT("record is not a JSON object");
    }
    auto it = object.find(field);
    if (it == object.end()) {
        throw ErrorT(std::string("missing field '") + field + "'");
    }
    return *it;
}

template <typename ErrorT>
std::string require_string(const json &object, const char *field) {
    const json &value = require<ErrorT>(object, field);
    if (!value.is_string()) {
        throw ErrorT(std::string("field '") + field + "' must be a string");
    }
    return value.get<std::string>();
}

template <typename ErrorT>
std::uint32_t require_count(const json &object, const char *field) {
    const json &value = require<ErrorT>(object, field);
    if (!value.is_number_integer()) {
        throw ErrorT(std::string("field '") + field + "' must be an integer");
    }
    if (value.is_number_unsigned()) {
        auto number = value.get<std::uint64_t>();
        if (number >= 1 && number <= std::numeric_limits<std::uint32_t>::max()) {
            return static_cast<std::uint32_t>(number);
        }
    } else {
        auto number = value.get<std::int64_t>();
        if (number >= 1 && number <= static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
            return static_cast<std::uint32_t>(number);
        }
    }
    throw ErrorT(std::string("field '") + field + "' must be between 1 and 4294967295");
}

} // namespace

json manifest_to_json(const Manifest &manifest) {
    json chunks = json::array();
    for (const auto &entry : manifest.entries) {
        chunks.push_back({
            {"chunk_file", entry.chunk_file},
            {"chunk_number", entry.index},
            {"total_chunks", entry.total},
            {"chunk_checksum", entry.checksum},
        });
    }
    return json{
        {"file_name", manifest.file_name},
        {"file_checksum", manifest.file_checksum},
        {"chunks", std::move(chunks)},
    };
}

json chunk_to_json(const Chunk &chunk) {
    return json{
        {"file_name", chunk.file_name},
        {"chunk_number", chunk.index},
        {"total_chunks", chunk.total},
        {"chunk_checksum", chunk.checksum},
        {"chunk_data", chunk.payload_encoded},
    };
}

Manifest manifest_from_json(const json &object) {
    Manifest manifest;
    manifest.file_name = require_string<ManifestMalformed>(object, "file_name");
    manifest.file_checksum = require_string<ManifestMalformed>(object, "file_checksum");
    const auto &chunks = require<ManifestMalformed>(object, "chunks");
    if (!chunks.is_array()) {
        throw ManifestMalformed("field 'chunks' must be an array", manifest.file_name);
    }
    manifest.entries.reserve(chunks.size());
    for (const auto &item : chunks) {
        ManifestEntry entry;
        try {
            entry.chunk_file = require_string<ManifestMalformed>(item, "chunk_file");
            entry.index = require_count<ManifestMalformed>(item, "chunk_number");
            entry.total = require_count<ManifestMalformed>(item, "total_chunks");
            entry.checksum = require_string<ManifestMalformed>(item, "chunk_checksum");
        } catch (const ManifestMalformed &err) {
            throw ManifestMalformed(std::string("chunk entry ") +
                                        std::to_string(manifest.entries.size() + 1) + ": " + err.what(),
                                    manifest.file_name, entry.index);
        }
        manifest.entries.push_back(std::move(entry));
    }
    return manifest;
}

Chunk chunk_from_json(const json &object) {
    Chunk chunk;
    chunk.file_name = require_string<DecodeError>(object, "file_name");
    chunk.index = require_count<DecodeError>(object, "chunk_number");
    chunk.total = require_count<DecodeError>(object, "total_chunks");
    chunk.checksum = require_string<DecodeError>(object, "chunk_checksum");
    chunk.payload_encoded = require_string<DecodeError>(object, "chunk_data");
    return chunk;
}

std::string dump_record(const json &object) {
    try {
        return object.dump(4) + "\n";
    } catch (const json::type_error &err) {
        // File names that are not valid UTF-8 cannot be stored in a JSON record.
        throw InvalidInput(std::string("cannot serialize record: ") + err.what());
    }
}

Manifest parse_manifest(const std::string &text) {
    json object;
    try {
        object = json::parse(text);
    } catch (const json::parse_error &err) {
        throw ManifestMalformed(std::string("manifest is not valid JSON: ") + err.what());
    }
    return manifest_from_json(object);
}

Chunk parse_chunk(const std::string &text) {
    json object;
    try {
        object = json::parse(text);
    } catch (const json::parse_error &err) {
        throw DecodeError(std::string("chunk record is not valid JSON: ") + err.what());
    }
    return chunk_from_json(object);
}

} // namespace hexsplit
