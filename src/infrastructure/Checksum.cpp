/**
 * @file Checksum.cpp
 * @brief OpenSSL EVP backed implementation of Checksum.
 */

#include "infrastructure/Checksum.hpp"
#include "domain/Errors.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <vector>

namespace chartkeeper::infrastructure {

namespace {

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdCtxPtr NewSha256Context() {
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("unable to initialize SHA-256 digest");
    }
    return ctx;
}

std::string Finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw std::runtime_error("unable to finalize SHA-256 digest");
    }

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0f]);
    }
    return out;
}

} // namespace

std::string Checksum::Sha256(const std::string& data) {
    auto ctx = NewSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("unable to update SHA-256 digest");
    }
    return Finish(ctx.get());
}

std::string Checksum::Sha256File(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw domain::StorageIOError("unable to open '" + path + "' for checksum");
    }

    auto ctx = NewSha256Context();
    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            throw std::runtime_error("unable to update SHA-256 digest");
        }
    }
    if (in.bad()) {
        throw domain::StorageIOError("read failed while computing checksum of '" + path + "'");
    }
    return Finish(ctx.get());
}

} // namespace chartkeeper::infrastructure
