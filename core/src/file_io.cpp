#include "hexsplit/file_io.hpp"

#include "hexsplit/errors.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace hexsplit {

namespace {

std::string describe(const std::string &what, const std::filesystem::path &path, int err) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "'";
    if (err != 0) {
        oss << ": " << std::strerror(err);
    }
    return oss.str();
}

} // namespace

std::vector<char> read_file(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StorageError(describe("failed to open file", path, errno));
    }
    std::vector<char> data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw StorageError(describe("failed to read file", path, errno));
    }
    return data;
}

std::string read_text_file(const std::filesystem::path &path) {
    auto data = read_file(path);
    return std::string(data.begin(), data.end());
}

void write_file_atomic(const std::filesystem::path &path, const char *data, std::size_t size) {
    auto temp_path = path;
    temp_path += ".part." + std::to_string(::getpid());
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StorageError(describe("failed to create file", temp_path, errno));
        }
        file.write(data, static_cast<std::streamsize>(size));
        file.flush();
        if (!file) {
            const int err = errno;
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw StorageError(describe("failed to write file", temp_path, err));
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw StorageError("failed to move '" + temp_path.string() + "' to '" + path.string() +
                           "': " + ec.message());
    }
}

void write_file_atomic(const std::filesystem::path &path, const std::vector<char> &data) {
    write_file_atomic(path, data.data(), data.size());
}

void write_file_atomic(const std::filesystem::path &path, const std::string &text) {
    write_file_atomic(path, text.data(), text.size());
}

} // namespace hexsplit
