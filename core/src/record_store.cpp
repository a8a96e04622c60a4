#include "hexsplit/record_store.hpp"

#include "hexsplit/errors.hpp"
#include "hexsplit/file_io.hpp"
#include "hexsplit/records.hpp"

#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace hexsplit {

namespace {

// A reference must name a plain file directly inside the store directory.
bool is_plain_name(const std::string &ref) {
    if (ref.empty() || ref == "." || ref == "..") {
        return false;
    }
    std::filesystem::path path(ref);
    return !path.has_root_path() && path.filename() == path;
}

} // namespace

std::string chunk_record_name(const std::string &file_name, std::uint32_t index,
                              std::uint32_t total) {
    std::ostringstream oss;
    oss << file_name << '_' << std::setfill('0') << std::setw(2) << index << '_' << std::setw(2)
        << total << ".json";
    return oss.str();
}

std::string manifest_record_name(const std::string &file_name) {
    return file_name + "_metadata.json";
}

DirectoryRecordStore::DirectoryRecordStore(std::filesystem::path directory, std::string manifest_name)
    : directory_(std::move(directory)), manifest_name_(std::move(manifest_name)) {
    if (directory_.empty()) {
        directory_ = ".";
    }
    if (!is_plain_name(manifest_name_)) {
        throw InvalidInput("manifest name must be a plain file name: '" + manifest_name_ + "'");
    }
}

DirectoryRecordStore DirectoryRecordStore::for_manifest(const std::filesystem::path &manifest_path) {
    return DirectoryRecordStore(manifest_path.parent_path(), manifest_path.filename().string());
}

Manifest DirectoryRecordStore::load_manifest() {
    const auto path = manifest_path();
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw StorageError("manifest '" + path.string() + "' does not exist");
    }
    return parse_manifest(read_text_file(path));
}

std::optional<Chunk> DirectoryRecordStore::load_chunk(const std::string &ref) {
    if (!is_plain_name(ref)) {
        return std::nullopt;
    }
    const auto path = directory_ / ref;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    try {
        return parse_chunk(read_text_file(path));
    } catch (const DecodeError &err) {
        throw DecodeError(std::string(err.what()) + " (" + path.string() + ")");
    }
}

void DirectoryRecordStore::save_manifest(const Manifest &manifest) {
    ensure_directory();
    write_file_atomic(manifest_path(), dump_record(manifest_to_json(manifest)));
}

void DirectoryRecordStore::save_chunk(const std::string &ref, const Chunk &chunk) {
    if (!is_plain_name(ref)) {
        throw InvalidInput("chunk reference must be a plain file name: '" + ref + "'");
    }
    ensure_directory();
    write_file_atomic(directory_ / ref, dump_record(chunk_to_json(chunk)));
}

const std::filesystem::path &DirectoryRecordStore::directory() const noexcept { return directory_; }

std::filesystem::path DirectoryRecordStore::manifest_path() const { return directory_ / manifest_name_; }

void DirectoryRecordStore::ensure_directory() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw StorageError("failed to create directory '" + directory_.string() + "': " + ec.message());
    }
}

void save_split(RecordStore &store, const SplitResult &result) {
    if (result.chunks.size() != result.manifest.entries.size()) {
        throw InvalidInput("split result has a different number of chunks and manifest entries");
    }
    for (std::size_t i = 0; i < result.chunks.size(); ++i) {
        store.save_chunk(result.manifest.entries[i].chunk_file, result.chunks[i]);
    }
    store.save_manifest(result.manifest);
}

ChunkLoader make_chunk_loader(RecordStore &store) {
    return [&store](const ManifestEntry &entry) { return store.load_chunk(entry.chunk_file); };
}

} // namespace hexsplit
