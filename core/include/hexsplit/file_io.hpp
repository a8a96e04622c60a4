#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace hexsplit {

std::vector<char> read_file(const std::filesystem::path &path);

std::string read_text_file(const std::filesystem::path &path);

// Writes into a sibling temporary file and renames it over `path`, so readers never
// observe a partially written file.
void write_file_atomic(const std::filesystem::path &path, const char *data, std::size_t size);

void write_file_atomic(const std::filesystem::path &path, const std::vector<char> &data);

void write_file_atomic(const std::filesystem::path &path, const std::string &text);

} // namespace hexsplit
