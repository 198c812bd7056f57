#include "bolster/checksum.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bolster {

namespace {

void init_md5(EVP_MD_CTX *ctx) {
    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5 context");
    }
}

} // namespace

Checksum::Md5Digest Checksum::md5(const std::vector<char> &data) {
    Md5Accumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.value();
}

std::string Checksum::md5_hex(const std::vector<char> &data) { return to_hex(md5(data)); }

std::string Checksum::to_hex(const Md5Digest &digest) {
    std::ostringstream oss;
    for (std::uint8_t byte : digest) {
        oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

Checksum::Md5Accumulator::Md5Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    try {
        init_md5(ctx_);
    } catch (const std::runtime_error &) {
        EVP_MD_CTX_free(ctx_);
        throw;
    }
}

Checksum::Md5Accumulator::~Md5Accumulator() { EVP_MD_CTX_free(ctx_); }

void Checksum::Md5Accumulator::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("Failed to update MD5 hash");
    }
}

void Checksum::Md5Accumulator::reset() { init_md5(ctx_); }

Checksum::Md5Digest Checksum::Md5Accumulator::value() const {
    EVP_MD_CTX *copy = EVP_MD_CTX_new();
    if (copy == nullptr) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    Md5Digest digest{};
    unsigned int length = 0;
    if (EVP_MD_CTX_copy_ex(copy, ctx_) != 1 ||
        EVP_DigestFinal_ex(copy, digest.data(), &length) != 1 || length != digest.size()) {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("Failed to finalize MD5 hash");
    }
    EVP_MD_CTX_free(copy);
    return digest;
}

std::string Checksum::Md5Accumulator::hex() const { return to_hex(value()); }

} // namespace bolster
