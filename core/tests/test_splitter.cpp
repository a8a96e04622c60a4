#include "hexsplit/checksum.hpp"
#include "hexsplit/errors.hpp"
#include "hexsplit/hex_codec.hpp"
#include "hexsplit/splitter.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

namespace {

std::string ref(const std::string &file_name, std::uint32_t index, std::uint32_t total) {
    return file_name + "#" + std::to_string(index) + "/" + std::to_string(total);
}

std::vector<char> sequence(std::size_t size) {
    std::vector<char> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + 7) & 0xFF);
    }
    return data;
}

std::vector<char> concat_payloads(const hexsplit::SplitResult &result) {
    std::vector<char> out;
    for (const auto &chunk : result.chunks) {
        auto payload = hexsplit::HexCodec::decode(chunk.payload_encoded);
        out.insert(out.end(), payload.begin(), payload.end());
    }
    return out;
}

void check_consistent(const hexsplit::SplitResult &result, const std::vector<char> &source,
                      std::size_t chunk_size) {
    const auto total = result.chunks.size();
    assert(result.manifest.entries.size() == total);
    assert(result.manifest.file_checksum == hexsplit::Checksum::md5_hex(source));
    for (std::size_t i = 0; i < total; ++i) {
        const auto &chunk = result.chunks[i];
        const auto &entry = result.manifest.entries[i];
        auto payload = hexsplit::HexCodec::decode(chunk.payload_encoded);
        assert(chunk.index == i + 1);
        assert(chunk.total == total);
        assert(entry.index == chunk.index);
        assert(entry.total == chunk.total);
        assert(entry.checksum == chunk.checksum);
        assert(chunk.checksum == hexsplit::Checksum::md5_hex(payload));
        assert(entry.chunk_file == ref(chunk.file_name, chunk.index, chunk.total));
        if (i + 1 < total) {
            assert(payload.size() == chunk_size);
        } else {
            assert(payload.size() <= chunk_size);
        }
    }
    assert(concat_payloads(result) == source);
}

} // namespace

int main() {
    // Ten bytes in chunks of three: 3, 3, 3, 1.
    {
        std::vector<char> source;
        for (char b = 0; b < 10; ++b) {
            source.push_back(b);
        }
        hexsplit::Splitter splitter(3);
        auto result = splitter.split(source, "ten.bin", ref);
        assert(result.chunks.size() == 4);
        assert(result.manifest.file_name == "ten.bin");
        std::vector<std::size_t> sizes;
        for (const auto &chunk : result.chunks) {
            assert(chunk.file_name == "ten.bin");
            sizes.push_back(hexsplit::HexCodec::decode(chunk.payload_encoded).size());
        }
        assert((sizes == std::vector<std::size_t>{3, 3, 3, 1}));
        assert(result.chunks[0].payload_encoded == "000102");
        assert(result.chunks[3].payload_encoded == "09");
        check_consistent(result, source, 3);
    }

    // Chunk count is ceil(len / size) for exact and ragged splits.
    {
        hexsplit::Splitter splitter(256);
        for (std::size_t size : {1u, 255u, 256u, 257u, 1024u, 1025u}) {
            auto source = sequence(size);
            auto result = splitter.split(source, "data.bin", ref);
            assert(result.chunks.size() == (size + 255) / 256);
            check_consistent(result, source, 256);
        }
    }

    // An empty source is one zero-length chunk.
    {
        hexsplit::Splitter splitter(16);
        auto result = splitter.split({}, "empty.bin", ref);
        assert(result.chunks.size() == 1);
        assert(result.chunks[0].index == 1);
        assert(result.chunks[0].total == 1);
        assert(result.chunks[0].payload_encoded.empty());
        assert(result.chunks[0].checksum == "d41d8cd98f00b204e9800998ecf8427e");
        assert(result.manifest.file_checksum == "d41d8cd98f00b204e9800998ecf8427e");
        check_consistent(result, {}, 16);
    }

    // A chunk size larger than the source gives a single short chunk.
    {
        auto source = sequence(5);
        hexsplit::Splitter splitter(1 << 20);
        auto result = splitter.split(source, "small.bin", ref);
        assert(result.chunks.size() == 1);
        assert(hexsplit::HexCodec::decode(result.chunks[0].payload_encoded) == source);
        assert(result.chunks[0].checksum == result.manifest.file_checksum);
    }

    // Partition ranges.
    {
        hexsplit::Splitter splitter(4);
        auto ranges = splitter.partition(10);
        assert(ranges.size() == 3);
        assert(ranges[0].index == 1 && ranges[0].offset == 0 && ranges[0].size == 4);
        assert(ranges[2].index == 3 && ranges[2].offset == 8 && ranges[2].size == 2);
        auto empty = splitter.partition(0);
        assert(empty.size() == 1 && empty[0].size == 0);
    }

    // Splitting is deterministic and the worker pool produces the serial result.
    {
        auto source = sequence(10000);
        hexsplit::Splitter serial(97);
        hexsplit::Splitter parallel(97, 4);
        auto first = serial.split(source, "det.bin", ref);
        auto second = serial.split(source, "det.bin", ref);
        auto pooled = parallel.split(source, "det.bin", ref);
        assert(first.manifest == second.manifest);
        assert(first.chunks == second.chunks);
        assert(first.manifest == pooled.manifest);
        assert(first.chunks == pooled.chunks);
        assert(parallel.concurrency() == 4);
        check_consistent(pooled, source, 97);
    }

    // More workers than chunks: every worker is joined and the result matches serial.
    {
        auto source = sequence(50);
        auto pooled = hexsplit::Splitter(20, 64).split(source, "few.bin", ref);
        auto serial = hexsplit::Splitter(20).split(source, "few.bin", ref);
        assert(pooled.chunks.size() == 3);
        assert(pooled.chunks == serial.chunks);
        assert(pooled.manifest == serial.manifest);
    }

    // Invalid configuration.
    {
        bool rejected = false;
        try {
            hexsplit::Splitter splitter(0);
        } catch (const hexsplit::InvalidInput &err) {
            rejected = err.kind() == hexsplit::ErrorKind::invalid_input;
        }
        assert(rejected);

        rejected = false;
        try {
            hexsplit::Splitter splitter(8, 0);
        } catch (const hexsplit::InvalidInput &) {
            rejected = true;
        }
        assert(rejected);

        rejected = false;
        try {
            hexsplit::Splitter(8).split(sequence(4), "", ref);
        } catch (const hexsplit::InvalidInput &) {
            rejected = true;
        }
        assert(rejected);

        rejected = false;
        try {
            hexsplit::Splitter(8).split(sequence(4), "x.bin", hexsplit::ChunkRefFn{});
        } catch (const hexsplit::InvalidInput &) {
            rejected = true;
        }
        assert(rejected);
    }
    return 0;
}
