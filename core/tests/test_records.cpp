#include "hexsplit/errors.hpp"
#include "hexsplit/records.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <string>

namespace {

using json = nlohmann::json;

const char *kManifest = R"({
    "file_name": "report.pdf",
    "file_checksum": "b5bc38c11fad01c269af7367facee155",
    "chunks": [
        {
            "chunk_file": "report.pdf_01_02.json",
            "chunk_number": 1,
            "total_chunks": 2,
            "chunk_checksum": "8b438280fe32fd9df1e212280be081d6"
        },
        {
            "chunk_file": "report.pdf_02_02.json",
            "chunk_number": 2,
            "total_chunks": 2,
            "chunk_checksum": "2a11e0953b4ead663c948483c94d3995"
        }
    ]
})";

const char *kChunk = R"({
    "file_name": "report.pdf",
    "chunk_number": 1,
    "total_chunks": 2,
    "chunk_checksum": "8b438280fe32fd9df1e212280be081d6",
    "chunk_data": "255044462d31"
})";

template <typename ErrorT, typename Fn>
bool fails_with(Fn fn) {
    try {
        fn();
    } catch (const ErrorT &) {
        return true;
    }
    return false;
}

bool manifest_rejected(const json &object) {
    return fails_with<hexsplit::ManifestMalformed>([&] { hexsplit::manifest_from_json(object); });
}

bool chunk_rejected(const json &object) {
    return fails_with<hexsplit::DecodeError>([&] { hexsplit::chunk_from_json(object); });
}

} // namespace

int main() {
    auto manifest = hexsplit::parse_manifest(kManifest);
    assert(manifest.file_name == "report.pdf");
    assert(manifest.file_checksum == "b5bc38c11fad01c269af7367facee155");
    assert(manifest.entries.size() == 2);
    assert(manifest.entries[1].chunk_file == "report.pdf_02_02.json");
    assert(manifest.entries[1].index == 2);
    assert(manifest.entries[1].total == 2);
    assert(manifest.entries[1].checksum == "2a11e0953b4ead663c948483c94d3995");

    auto chunk = hexsplit::parse_chunk(kChunk);
    assert(chunk.file_name == "report.pdf");
    assert(chunk.index == 1);
    assert(chunk.total == 2);
    assert(chunk.payload_encoded == "255044462d31");

    // Serialized records keep the field names and read back unchanged.
    auto manifest_json = hexsplit::manifest_to_json(manifest);
    assert(manifest_json == json::parse(kManifest));
    assert(hexsplit::parse_manifest(hexsplit::dump_record(manifest_json)) == manifest);
    assert(hexsplit::chunk_to_json(chunk) == json::parse(kChunk));
    assert(hexsplit::parse_chunk(hexsplit::dump_record(hexsplit::chunk_to_json(chunk))) == chunk);

    auto text = hexsplit::dump_record(hexsplit::chunk_to_json(chunk));
    assert(text.find("\n    \"chunk_checksum\"") != std::string::npos);
    assert(text == hexsplit::dump_record(hexsplit::chunk_to_json(chunk)));

    // Missing or mistyped manifest fields.
    const auto good_manifest = json::parse(kManifest);
    for (const char *field : {"file_name", "file_checksum", "chunks"}) {
        auto broken = good_manifest;
        broken.erase(field);
        assert(manifest_rejected(broken));
    }
    for (const char *field : {"chunk_file", "chunk_number", "total_chunks", "chunk_checksum"}) {
        auto broken = good_manifest;
        broken["chunks"][1].erase(field);
        assert(manifest_rejected(broken));
    }
    {
        auto broken = good_manifest;
        broken["chunks"] = json::object();
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["chunks"][0]["chunk_number"] = "1";
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["chunks"][0]["chunk_number"] = 0;
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["chunks"][0]["total_chunks"] = -2;
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["chunks"][0]["total_chunks"] = 2.5;
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["chunks"][0]["chunk_number"] = 4294967296ULL;
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["file_checksum"] = nullptr;
        assert(manifest_rejected(broken));
        broken = good_manifest;
        broken["chunks"][1] = "report.pdf_02_02.json";
        assert(manifest_rejected(broken));
        assert(manifest_rejected(json::array()));
    }
    assert(fails_with<hexsplit::ManifestMalformed>([] { hexsplit::parse_manifest("{\"file_name\": "); }));
    assert(fails_with<hexsplit::ManifestMalformed>([] { hexsplit::parse_manifest(""); }));

    // Missing or mistyped chunk fields.
    const auto good_chunk = json::parse(kChunk);
    for (const char *field : {"file_name", "chunk_number", "total_chunks", "chunk_checksum", "chunk_data"}) {
        auto broken = good_chunk;
        broken.erase(field);
        assert(chunk_rejected(broken));
    }
    {
        auto broken = good_chunk;
        broken["chunk_data"] = 255044;
        assert(chunk_rejected(broken));
        broken = good_chunk;
        broken["chunk_number"] = -1;
        assert(chunk_rejected(broken));
        assert(chunk_rejected(json("chunk")));
    }
    assert(fails_with<hexsplit::DecodeError>([] { hexsplit::parse_chunk("not json"); }));

    // Names that are not UTF-8 cannot be written.
    {
        auto bad = chunk;
        bad.file_name = std::string("\xff\xfe.bin");
        assert(fails_with<hexsplit::InvalidInput>(
            [&] { hexsplit::dump_record(hexsplit::chunk_to_json(bad)); }));
    }
    return 0;
}
