#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace bolster {

class Checksum {
  public:
    using Md5Digest = std::array<std::uint8_t, 16>;

    static Md5Digest md5(const std::vector<char> &data);

    static std::string md5_hex(const std::vector<char> &data);

    static std::string to_hex(const Md5Digest &digest);

    // Streaming MD5. Bytes must be fed in file order.
    class Md5Accumulator {
      public:
        Md5Accumulator();
        ~Md5Accumulator();

        Md5Accumulator(const Md5Accumulator &) = delete;
        Md5Accumulator &operator=(const Md5Accumulator &) = delete;

        void update(const char *data, std::size_t size);

        void reset();

        // Does not consume the running state; more updates may follow.
        Md5Digest value() const;

        std::string hex() const;

      private:
        evp_md_ctx_st *ctx_;
    };
};

} // namespace bolster
