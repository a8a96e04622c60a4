#pragma once

#include "hexsplit/assembler.hpp"
#include "hexsplit/model.hpp"
#include "hexsplit/splitter.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace hexsplit {

// <file_name>_<NN>_<TT>.json, numbers zero-padded to at least two digits.
std::string chunk_record_name(const std::string &file_name, std::uint32_t index,
                              std::uint32_t total);

// <file_name>_metadata.json
std::string manifest_record_name(const std::string &file_name);

class RecordStore {
  public:
    virtual ~RecordStore() = default;

    virtual Manifest load_manifest() = 0;

    // Empty when no record exists under `ref`.
    virtual std::optional<Chunk> load_chunk(const std::string &ref) = 0;

    virtual void save_manifest(const Manifest &manifest) = 0;

    virtual void save_chunk(const std::string &ref, const Chunk &chunk) = 0;
};

// One JSON file per record, all in one directory. Chunk references are file names
// inside that directory.
class DirectoryRecordStore : public RecordStore {
  public:
    DirectoryRecordStore(std::filesystem::path directory, std::string manifest_name);

    // Store rooted at the manifest's directory.
    static DirectoryRecordStore for_manifest(const std::filesystem::path &manifest_path);

    Manifest load_manifest() override;

    std::optional<Chunk> load_chunk(const std::string &ref) override;

    void save_manifest(const Manifest &manifest) override;

    void save_chunk(const std::string &ref, const Chunk &chunk) override;

    const std::filesystem::path &directory() const noexcept;

    std::filesystem::path manifest_path() const;

  private:
    void ensure_directory();

    std::filesystem::path directory_;
    std::string manifest_name_;
};

// Chunks first, manifest last: an interrupted run leaves no manifest behind.
void save_split(RecordStore &store, const SplitResult &result);

ChunkLoader make_chunk_loader(RecordStore &store);

} // namespace hexsplit
