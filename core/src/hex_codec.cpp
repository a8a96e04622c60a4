#include "hexsplit/hex_codec.hpp"

#include "hexsplit/errors.hpp"

#include <sstream>

namespace hexsplit {

namespace {

constexpr char digits[] = "0123456789abcdef";

int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string HexCodec::encode(const char *data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        auto byte = static_cast<unsigned char>(data[i]);
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0Fu]);
    }
    return out;
}

std::string HexCodec::encode(const std::vector<char> &data) {
    return encode(data.data(), data.size());
}

std::vector<char> HexCodec::decode(const std::string &text) {
    if (text.size() % 2 != 0) {
        std::ostringstream oss;
        oss << "hex data has odd length " << text.size();
        throw DecodeError(oss.str());
    }
    std::vector<char> out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int high = nibble(text[i]);
        int low = nibble(text[i + 1]);
        if (high < 0 || low < 0) {
            std::ostringstream oss;
            oss << "invalid hex character at offset " << (high < 0 ? i : i + 1);
            throw DecodeError(oss.str());
        }
        out.push_back(static_cast<char>((high << 4) | low));
    }
    return out;
}

} // namespace hexsplit
