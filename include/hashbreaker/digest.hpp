/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hashbreaker {

// Reusable digest context for one hash mode (MD5, SHA1, SHA256, SHA512).
class Digester final {
public:
    explicit Digester(int hashTypeId);
    ~Digester();

    Digester(const Digester&) = delete;
    Digester& operator=(const Digester&) = delete;

    [[nodiscard]] bool valid() const noexcept { return md_ != nullptr && ctx_ != nullptr; }

    // Lowercase hex digest; empty on failure or when !valid().
    [[nodiscard]] std::string hex(std::string_view data) noexcept;

private:
    struct Context;
    const void* md_ = nullptr;
    std::unique_ptr<Context> ctx_;
};

[[nodiscard]] bool supportsCpuDigest(int hashTypeId) noexcept;

// One-shot convenience.
[[nodiscard]] std::optional<std::string> hexDigest(int hashTypeId, std::string_view data);

} // namespace hashbreaker
