#include "hexsplit/assembler.hpp"
#include "hexsplit/errors.hpp"
#include "hexsplit/file_io.hpp"
#include "hexsplit/record_store.hpp"
#include "hexsplit/splitter.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <string>
#include <vector>

namespace {

constexpr int kExitUsage = 2;
constexpr long long kBytesPerMegabyte = 1024LL * 1024LL;

class UsageError : public std::runtime_error {
   public:
    explicit UsageError(const std::string &msg) : std::runtime_error(msg) {}
};

struct ChunkOptions {
    std::filesystem::path file;
    long long size_mb = 0;
    std::optional<long long> chunk_bytes;
    std::filesystem::path output_dir = ".";
    long long jobs = 1;
};

struct ReassembleOptions {
    std::filesystem::path manifest;
    std::filesystem::path output;
    bool verify_only = false;
};

long long parse_number(const std::string &option, const std::string &text) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception &) {
        throw UsageError("invalid number for " + option + ": " + text);
    }
    if (used != text.size()) {
        throw UsageError("invalid number for " + option + ": " + text);
    }
    return value;
}

void print_usage() {
    std::cerr << "Usage:\n"
                 "  hexsplit chunk <file> <size_mb> [--chunk-bytes <bytes>] [--output-dir <dir>] "
                 "[--jobs <n>]\n"
                 "  hexsplit reassemble <manifest.json> [--output <path>]\n"
                 "  hexsplit verify <manifest.json>\n"
                 "\n"
                 "Chunk records are hex encoded JSON: larger than the binary input, but they\n"
                 "compress better and pass through text-only channels.\n";
}

ChunkOptions parse_chunk(int argc, char **argv) {
    ChunkOptions opts;
    std::vector<std::string> positional;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--chunk-bytes" && i + 1 < argc) {
            opts.chunk_bytes = parse_number(arg, argv[++i]);
        } else if (arg == "--output-dir" && i + 1 < argc) {
            opts.output_dir = argv[++i];
        } else if (arg == "--jobs" && i + 1 < argc) {
            opts.jobs = parse_number(arg, argv[++i]);
        } else if (arg.rfind("--", 0) == 0) {
            throw UsageError("unknown or incomplete option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        throw UsageError("missing input file");
    }
    if (positional.size() > 2) {
        throw UsageError("unexpected argument: " + positional[2]);
    }
    opts.file = positional[0];
    if (positional.size() == 2) {
        opts.size_mb = parse_number("size_mb", positional[1]);
    } else if (!opts.chunk_bytes) {
        throw UsageError("chunk size must be specified in 'chunk' mode");
    }
    return opts;
}

ReassembleOptions parse_reassemble(int argc, char **argv, bool verify_only) {
    ReassembleOptions opts;
    opts.verify_only = verify_only;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc && !verify_only) {
            opts.output = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            throw UsageError("unknown or incomplete option: " + arg);
        } else if (opts.manifest.empty()) {
            opts.manifest = arg;
        } else {
            throw UsageError("unexpected argument: " + arg);
        }
    }
    if (opts.manifest.empty()) {
        throw UsageError("missing manifest file");
    }
    return opts;
}

std::size_t chunk_size_bytes(const ChunkOptions &opts) {
    if (opts.chunk_bytes) {
        if (*opts.chunk_bytes <= 0) {
            throw hexsplit::InvalidInput("chunk size must be > 0");
        }
        return static_cast<std::size_t>(*opts.chunk_bytes);
    }
    if (opts.size_mb <= 0) {
        throw hexsplit::InvalidInput("chunk size must be > 0");
    }
    if (opts.size_mb > std::numeric_limits<long long>::max() / kBytesPerMegabyte) {
        throw hexsplit::InvalidInput("chunk size is too large");
    }
    return static_cast<std::size_t>(opts.size_mb * kBytesPerMegabyte);
}

void run_chunk(const ChunkOptions &opts) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(opts.file, ec)) {
        throw hexsplit::StorageError("file " + opts.file.string() + " does not exist");
    }
    if (opts.jobs <= 0) {
        throw hexsplit::InvalidInput("--jobs must be > 0");
    }
    const auto chunk_size = chunk_size_bytes(opts);
    const auto file_name = opts.file.filename().string();

    std::cout << "Chunking file: " << opts.file.string() << " into " << chunk_size << "-byte chunks..."
              << std::endl;

    hexsplit::Splitter splitter(chunk_size, static_cast<std::size_t>(opts.jobs));
    auto source = hexsplit::read_file(opts.file);
    auto result = splitter.split(source, file_name, hexsplit::chunk_record_name);

    hexsplit::DirectoryRecordStore store(opts.output_dir, hexsplit::manifest_record_name(file_name));
    hexsplit::save_split(store, result);

    std::cout << "Wrote " << result.chunks.size() << " chunk(s), file checksum "
              << result.manifest.file_checksum << std::endl;
    std::cout << "Chunking complete. Metadata file: " << store.manifest_path().string() << std::endl;
}

void run_reassemble(const ReassembleOptions &opts) {
    std::cout << (opts.verify_only ? "Verifying" : "Reassembling")
              << " file using metadata: " << opts.manifest.string() << "..." << std::endl;

    auto store = hexsplit::DirectoryRecordStore::for_manifest(opts.manifest);
    auto manifest = store.load_manifest();

    auto observer = [](hexsplit::AssemblyStage stage, std::uint32_t chunk_number, std::uint32_t total) {
        if (stage == hexsplit::AssemblyStage::verifying_chunk) {
            std::cout << "  chunk " << chunk_number << "/" << total << std::endl;
        }
    };
    hexsplit::Assembler assembler;
    auto data = assembler.reassemble(manifest, hexsplit::make_chunk_loader(store), observer);

    if (opts.verify_only) {
        std::cout << "Verification complete. " << data.size() << " bytes, checksum verified." << std::endl;
        return;
    }

    auto output = opts.output;
    if (output.empty()) {
        const auto name = std::filesystem::path(manifest.file_name).filename();
        if (name.empty() || name == "." || name == "..") {
            throw hexsplit::InvalidInput("manifest file name '" + manifest.file_name +
                                         "' cannot name an output file, use --output");
        }
        output = store.directory() / ("reassembled_" + name.string());
    }
    hexsplit::write_file_atomic(output, data);
    std::cout << "Reassembly complete. Checksum verified. Output: " << output.string() << std::endl;
}

void report(const hexsplit::Error &err) {
    std::ostringstream oss;
    oss << "error: " << hexsplit::to_string(err.kind()) << ": " << err.what();
    if (!err.file_name().empty()) {
        oss << " (file '" << err.file_name() << "'";
        if (err.chunk_number() != 0) {
            oss << ", chunk " << err.chunk_number();
        }
        oss << ")";
    }
    if (hexsplit::is_corruption(err.kind())) {
        oss << "; the chunk records were altered or damaged in transit";
    }
    std::cerr << oss.str() << std::endl;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    std::string mode = argv[1];
    try {
        if (mode == "chunk") {
            ChunkOptions opts = parse_chunk(argc - 2, argv + 2);
            run_chunk(opts);
        } else if (mode == "reassemble") {
            ReassembleOptions opts = parse_reassemble(argc - 2, argv + 2, false);
            run_reassemble(opts);
        } else if (mode == "verify") {
            ReassembleOptions opts = parse_reassemble(argc - 2, argv + 2, true);
            run_reassemble(opts);
        } else if (mode == "--help" || mode == "-h" || mode == "?") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            throw UsageError("unknown mode: " + mode);
        }
    } catch (const UsageError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        print_usage();
        return kExitUsage;
    } catch (const hexsplit::Error &err) {
        report(err);
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
