#include "hexsplit/assembler.hpp"

#include "hexsplit/checksum.hpp"
#include "hexsplit/errors.hpp"
#include "hexsplit/hex_codec.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace hexsplit {

namespace {

void notify(const AssemblyObserver &observer, AssemblyStage stage, std::uint32_t chunk_number,
            std::uint32_t total) {
    if (observer) {
        observer(stage, chunk_number, total);
    }
}

} // namespace

const char *to_string(AssemblyStage stage) noexcept {
    switch (stage) {
    case AssemblyStage::start:
        return "start";
    case AssemblyStage::loading_chunk:
        return "loading chunk";
    case AssemblyStage::verifying_chunk:
        return "verifying chunk";
    case AssemblyStage::whole_verify:
        return "verifying file";
    case AssemblyStage::done:
        return "done";
    case AssemblyStage::failed:
        return "failed";
    }
    return "unknown";
}

std::vector<ManifestEntry> Assembler::validate(const Manifest &manifest) {
    const auto &name = manifest.file_name;
    if (name.empty()) {
        throw ManifestMalformed("manifest has no file name");
    }
    if (!Checksum::is_digest(manifest.file_checksum)) {
        throw ManifestMalformed("file checksum is not an MD5 digest: '" + manifest.file_checksum + "'",
                                name);
    }
    if (manifest.entries.empty()) {
        throw ManifestMalformed("manifest lists no chunks", name);
    }

    const auto total = manifest.entries.front().total;
    for (const auto &entry : manifest.entries) {
        if (entry.total != total) {
            std::ostringstream oss;
            oss << "chunk " << entry.index << " claims " << entry.total << " total chunks, expected "
                << total;
            throw ManifestMalformed(oss.str(), name, entry.index);
        }
        if (entry.chunk_file.empty()) {
            throw ManifestMalformed("chunk entry has no chunk file", name, entry.index);
        }
        if (!Checksum::is_digest(entry.checksum)) {
            throw ManifestMalformed("chunk checksum is not an MD5 digest: '" + entry.checksum + "'",
                                    name, entry.index);
        }
    }
    if (total != manifest.entries.size()) {
        std::ostringstream oss;
        oss << "manifest lists " << manifest.entries.size() << " chunks but total is " << total;
        throw ManifestMalformed(oss.str(), name);
    }

    std::vector<ManifestEntry> sorted = manifest.entries;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ManifestEntry &a, const ManifestEntry &b) { return a.index < b.index; });
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const auto expected = static_cast<std::uint32_t>(i + 1);
        if (sorted[i].index != expected) {
            std::ostringstream oss;
            if (sorted[i].index < expected) {
                oss << "chunk number " << sorted[i].index << " appears more than once";
            } else {
                oss << "chunk number " << expected << " is missing";
            }
            throw ManifestMalformed(oss.str(), name, expected);
        }
    }
    return sorted;
}

std::vector<char> Assembler::reassemble(const Manifest &manifest, const ChunkLoader &loader,
                                        const AssemblyObserver &observer) const {
    notify(observer, AssemblyStage::start, 0, 0);
    try {
        const auto entries = validate(manifest);
        const auto total = static_cast<std::uint32_t>(entries.size());

        std::vector<char> output;
        for (const auto &entry : entries) {
            notify(observer, AssemblyStage::loading_chunk, entry.index, total);
            std::optional<Chunk> chunk;
            if (loader) {
                try {
                    chunk = loader(entry);
                } catch (const DecodeError &err) {
                    if (err.chunk_number() != 0) {
                        throw;
                    }
                    throw DecodeError(err.what(), manifest.file_name, entry.index);
                } catch (const StorageError &err) {
                    throw ChunkMissing("chunk record '" + entry.chunk_file +
                                           "' could not be read: " + err.what(),
                                       manifest.file_name, entry.index);
                }
            }
            if (!chunk) {
                throw ChunkMissing("chunk record '" + entry.chunk_file + "' not found",
                                   manifest.file_name, entry.index);
            }
            notify(observer, AssemblyStage::verifying_chunk, entry.index, total);
            auto payload = verify_chunk(manifest, entry, *chunk);
            output.insert(output.end(), payload.begin(), payload.end());
        }

        notify(observer, AssemblyStage::whole_verify, 0, total);
        const auto actual = Checksum::md5_hex(output);
        if (!Checksum::equal(actual, manifest.file_checksum)) {
            throw WholeFileChecksumMismatch("file checksum " + actual + " does not match manifest " +
                                                manifest.file_checksum,
                                            manifest.file_name);
        }
        notify(observer, AssemblyStage::done, 0, total);
        return output;
    } catch (const std::exception &) {
        notify(observer, AssemblyStage::failed, 0, 0);
        throw;
    }
}

std::vector<char> Assembler::verify_chunk(const Manifest &manifest, const ManifestEntry &entry,
                                          const Chunk &chunk) const {
    const auto &name = manifest.file_name;
    if (chunk.file_name != name) {
        throw ChunkIdentityMismatch("chunk belongs to '" + chunk.file_name + "'", name, entry.index);
    }
    if (chunk.index != entry.index || chunk.total != entry.total) {
        std::ostringstream oss;
        oss << "chunk record says " << chunk.index << " of " << chunk.total << ", manifest says "
            << entry.index << " of " << entry.total;
        throw ChunkIdentityMismatch(oss.str(), name, entry.index);
    }

    std::vector<char> payload;
    try {
        payload = HexCodec::decode(chunk.payload_encoded);
    } catch (const DecodeError &err) {
        throw DecodeError(err.what(), name, entry.index);
    }

    const auto actual = Checksum::md5_hex(payload);
    if (!Checksum::equal(actual, chunk.checksum)) {
        throw ChunkChecksumMismatch("payload checksum " + actual + " does not match chunk record " +
                                        chunk.checksum,
                                    name, entry.index);
    }
    if (!Checksum::equal(actual, entry.checksum)) {
        throw ChunkChecksumMismatch("payload checksum " + actual + " does not match manifest " +
                                        entry.checksum,
                                    name, entry.index);
    }
    return payload;
}

} // namespace hexsplit
