#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hexsplit {

class HexCodec {
  public:
    // Lowercase, two characters per byte.
    static std::string encode(const char *data, std::size_t size);

    static std::string encode(const std::vector<char> &data);

    // Accepts either case. Throws DecodeError on odd length or a non-hex character.
    static std::vector<char> decode(const std::string &text);
};

} // namespace hexsplit
