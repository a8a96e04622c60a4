#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace hexsplit {

// MD5 digests rendered as 32 lowercase hex characters.
class Checksum {
  public:
    static constexpr std::size_t digest_hex_length = 32;

    static std::string md5_hex(const std::vector<char> &data);

    static std::string md5_hex(const char *data, std::size_t size);

    static bool is_digest(const std::string &text) noexcept;

    static bool equal(const std::string &lhs, const std::string &rhs) noexcept;

    class Md5Accumulator {
      public:
        Md5Accumulator();
        ~Md5Accumulator();

        Md5Accumulator(const Md5Accumulator &) = delete;
        Md5Accumulator &operator=(const Md5Accumulator &) = delete;

        void update(const char *data, std::size_t size);

        // Finalizes the digest; further updates are rejected.
        std::string hex();

      private:
        struct ContextDeleter {
            void operator()(evp_md_ctx_st *ctx) const noexcept;
        };

        std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
        std::string hex_;
        bool finished_{false};
    };
};

} // namespace hexsplit
