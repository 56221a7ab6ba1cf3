/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/digest.hpp"
#include "hashbreaker/types.hpp"
#include <openssl/evp.h>

namespace hashbreaker {

namespace {

const EVP_MD* digestFor(int hashTypeId) noexcept {
    switch (hashTypeId) {
        case hashmode::MD5: return EVP_md5();
        case hashmode::SHA1: return EVP_sha1();
        case hashmode::SHA256: return EVP_sha256();
        case hashmode::SHA512: return EVP_sha512();
        default: return nullptr;
    }
}

std::string toHex(const unsigned char* data, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace

struct Digester::Context {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    ~Context() { EVP_MD_CTX_free(ctx); }
};

Digester::Digester(int hashTypeId)
    : md_(digestFor(hashTypeId)) {
    if (md_) {
        ctx_ = std::make_unique<Context>();
        if (!ctx_->ctx) {
            ctx_.reset();
        }
    }
}

Digester::~Digester() = default;

std::string Digester::hex(std::string_view data) noexcept {
    if (!valid()) {
        return {};
    }
    try {
        EVP_MD_CTX* ctx = ctx_->ctx;
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestInit_ex(ctx, static_cast<const EVP_MD*>(md_), nullptr) != 1 ||
            EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
            EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
            return {};
        }
        return toHex(digest, len);
    } catch (const std::exception&) {
        return {};
    }
}

bool supportsCpuDigest(int hashTypeId) noexcept {
    return digestFor(hashTypeId) != nullptr;
}

std::optional<std::string> hexDigest(int hashTypeId, std::string_view data) {
    Digester digester(hashTypeId);
    if (!digester.valid()) {
        return std::nullopt;
    }
    std::string hex = digester.hex(data);
    if (hex.empty()) {
        return std::nullopt;
    }
    return hex;
}

} // namespace hashbreaker
