#pragma once

#include "hexsplit/model.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace hexsplit {

// Produces the chunk a manifest entry refers to, or nothing if it cannot be found.
using ChunkLoader = std::function<std::optional<Chunk>(const ManifestEntry &entry)>;

enum class AssemblyStage {
    start,
    loading_chunk,
    verifying_chunk,
    whole_verify,
    done,
    failed,
};

const char *to_string(AssemblyStage stage) noexcept;

// Notified on every stage transition. chunk_number is 0 outside the per-chunk stages.
using AssemblyObserver =
    std::function<void(AssemblyStage stage, std::uint32_t chunk_number, std::uint32_t total)>;

// Rebuilds the original bytes from a manifest and its chunks. Every chunk is checked
// against its own checksum and the manifest's before the whole-file digest is compared;
// the first failure aborts the run and nothing is returned.
class Assembler {
  public:
    std::vector<char> reassemble(const Manifest &manifest, const ChunkLoader &loader,
                                 const AssemblyObserver &observer = {}) const;

    // Returns the entries sorted by chunk number. Throws ManifestMalformed unless they
    // form exactly 1..total with a single total.
    static std::vector<ManifestEntry> validate(const Manifest &manifest);

  private:
    std::vector<char> verify_chunk(const Manifest &manifest, const ManifestEntry &entry,
                                   const Chunk &chunk) const;
};

} // namespace hexsplit
