#pragma once

#include "chunkvault/core/result.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkvault::crypto {

constexpr size_t SHA256_DIGEST_SIZE = 32;

using Sha256Digest = std::array<std::uint8_t, SHA256_DIGEST_SIZE>;

// Initializes libsodium once per process. Safe to call repeatedly.
bool initialize_sodium();

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(std::span<std::uint8_t> output);
    Sha256Digest finalize();

    static Sha256Digest hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, Sha256Digest& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string digest_to_hex(const Sha256Digest& digest);
std::optional<Sha256Digest> digest_from_hex(const std::string& hex_string);

// Lowercase hex SHA-256 of the exact byte range
std::string checksum_hex(std::span<const std::uint8_t> data);

bool verify_checksum(std::span<const std::uint8_t> data, const std::string& expected_hex);

}

} // namespace chunkvault::crypto
