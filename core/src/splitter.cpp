#include "hexsplit/splitter.hpp"

#include "hexsplit/checksum.hpp"
#include "hexsplit/errors.hpp"
#include "hexsplit/hex_codec.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <mutex>
#include <queue>
#include <sstream>
#include <system_error>
#include <thread>

namespace hexsplit {

Splitter::Splitter(std::size_t chunk_size_bytes, std::size_t concurrency)
    : chunk_size_bytes_(chunk_size_bytes), concurrency_(concurrency) {
    if (chunk_size_bytes_ == 0) {
        throw InvalidInput("chunk size must be > 0");
    }
    if (concurrency_ == 0) {
        throw InvalidInput("concurrency must be > 0");
    }
}

std::vector<ChunkRange> Splitter::partition(std::uint64_t total_size) const {
    const std::uint64_t count = total_size / chunk_size_bytes_ + (total_size % chunk_size_bytes_ != 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        std::ostringstream oss;
        oss << "chunk size " << chunk_size_bytes_ << " yields too many chunks (" << count << ")";
        throw InvalidInput(oss.str());
    }
    std::vector<ChunkRange> ranges;
    ranges.reserve(static_cast<std::size_t>(count) + 1);
    std::uint32_t index = 1;
    for (std::uint64_t offset = 0; offset < total_size; offset += chunk_size_bytes_) {
        const auto remaining = total_size - offset;
        const auto size = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk_size_bytes_));
        ranges.push_back(ChunkRange{index++, offset, size});
    }
    if (ranges.empty()) {
        ranges.push_back(ChunkRange{1, 0, 0});
    }
    return ranges;
}

SplitResult Splitter::split(const std::vector<char> &source, const std::string &file_name,
                            const ChunkRefFn &chunk_ref) const {
    if (file_name.empty()) {
        throw InvalidInput("file name must not be empty");
    }
    if (!chunk_ref) {
        throw InvalidInput("no chunk naming function given");
    }
    const auto ranges = partition(source.size());
    const auto total = static_cast<std::uint32_t>(ranges.size());

    SplitResult result;
    if (concurrency_ > 1 && ranges.size() > 1) {
        result.chunks = make_chunks_parallel(source, ranges, file_name);
    } else {
        result.chunks.reserve(ranges.size());
        for (const auto &range : ranges) {
            result.chunks.push_back(make_chunk(source, range, file_name, total));
        }
    }

    result.manifest.file_name = file_name;
    result.manifest.file_checksum = Checksum::md5_hex(source);
    result.manifest.entries.reserve(result.chunks.size());
    for (const auto &chunk : result.chunks) {
        result.manifest.entries.push_back(
            ManifestEntry{chunk_ref(file_name, chunk.index, total), chunk.index, total, chunk.checksum});
    }
    return result;
}

std::size_t Splitter::chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

std::size_t Splitter::concurrency() const noexcept { return concurrency_; }

Chunk Splitter::make_chunk(const std::vector<char> &source, const ChunkRange &range,
                           const std::string &file_name, std::uint32_t total) const {
    const char *begin = source.data() + range.offset;
    Chunk chunk;
    chunk.file_name = file_name;
    chunk.index = range.index;
    chunk.total = total;
    chunk.checksum = Checksum::md5_hex(begin, range.size);
    chunk.payload_encoded = HexCodec::encode(begin, range.size);
    return chunk;
}

std::vector<Chunk> Splitter::make_chunks_parallel(const std::vector<char> &source,
                                                  const std::vector<ChunkRange> &ranges,
                                                  const std::string &file_name) const {
    const auto total = static_cast<std::uint32_t>(ranges.size());
    std::vector<Chunk> chunks(ranges.size());

    std::mutex mutex;
    std::queue<ChunkRange> pending;
    for (const auto &range : ranges) {
        pending.push(range);
    }
    std::exception_ptr failure;

    auto worker = [&] {
        while (true) {
            ChunkRange range;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (pending.empty() || failure) {
                    return;
                }
                range = pending.front();
                pending.pop();
            }
            try {
                // Each slot is written by exactly one worker.
                chunks[range.index - 1] = make_chunk(source, range, file_name, total);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    };

    const auto thread_count = std::min(concurrency_, ranges.size());
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    auto join_all = [&threads] {
        for (auto &thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    };
    try {
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error &) {
        // Stop the workers already running before the vector goes away.
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!failure) {
                failure = std::current_exception();
            }
        }
        join_all();
        throw;
    }
    join_all();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return chunks;
}

} // namespace hexsplit
