#pragma once

#include "hexsplit/model.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace hexsplit {

// Names the record that will hold chunk `index` of `total` for `file_name`.
using ChunkRefFn = std::function<std::string(const std::string &file_name, std::uint32_t index,
                                             std::uint32_t total)>;

struct SplitResult {
    Manifest manifest;
    std::vector<Chunk> chunks;
};

// Cuts a byte sequence into fixed-size chunks, each MD5-checksummed and hex-encoded,
// and builds the manifest that ties them together. An empty source yields a single
// zero-length chunk so every manifest has at least one entry.
class Splitter {
  public:
    explicit Splitter(std::size_t chunk_size_bytes, std::size_t concurrency = 1);

    std::vector<ChunkRange> partition(std::uint64_t total_size) const;

    SplitResult split(const std::vector<char> &source, const std::string &file_name,
                      const ChunkRefFn &chunk_ref) const;

    std::size_t chunk_size_bytes() const noexcept;

    std::size_t concurrency() const noexcept;

  private:
    Chunk make_chunk(const std::vector<char> &source, const ChunkRange &range,
                     const std::string &file_name, std::uint32_t total) const;

    std::vector<Chunk> make_chunks_parallel(const std::vector<char> &source,
                                            const std::vector<ChunkRange> &ranges,
                                            const std::string &file_name) const;

    std::size_t chunk_size_bytes_;
    std::size_t concurrency_;
};

} // namespace hexsplit
