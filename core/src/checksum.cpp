#include "hexsplit/checksum.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hexsplit {

namespace {

std::string to_hex(const unsigned char *digest, unsigned int length) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

std::string Checksum::md5_hex(const std::vector<char> &data) {
    return md5_hex(data.data(), data.size());
}

std::string Checksum::md5_hex(const char *data, std::size_t size) {
    Md5Accumulator accumulator;
    accumulator.update(data, size);
    return accumulator.hex();
}

bool Checksum::is_digest(const std::string &text) noexcept {
    if (text.size() != digest_hex_length) {
        return false;
    }
    for (unsigned char c : text) {
        if (!std::isxdigit(c)) {
            return false;
        }
    }
    return true;
}

bool Checksum::equal(const std::string &lhs, const std::string &rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
        auto b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

void Checksum::Md5Accumulator::ContextDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Checksum::Md5Accumulator::Md5Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("failed to initialize MD5 digest");
    }
}

Checksum::Md5Accumulator::~Md5Accumulator() = default;

void Checksum::Md5Accumulator::update(const char *data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("MD5 digest already finalized");
    }
    if (data == nullptr || size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("failed to update MD5 digest");
    }
}

std::string Checksum::Md5Accumulator::hex() {
    if (finished_) {
        return hex_;
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("failed to finalize MD5 digest");
    }
    finished_ = true;
    hex_ = to_hex(digest, length);
    return hex_;
}

} // namespace hexsplit
