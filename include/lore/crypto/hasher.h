#pragma once

#include <lore/core/types.h>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace lore::crypto {

// SHA-256 over OpenSSL EVP, hex encoded output
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);
    std::string finalize();

    // Static utilities for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Hash text without throwing
 *
 * OpenSSL failures are reported as ErrorCode::InternalError.
 */
Result<std::string> sha256Hex(std::string_view text);

} // namespace lore::crypto
