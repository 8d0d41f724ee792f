#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <atomic>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto {

using core::ErrorCode;
using core::Result;

bool initialize_sodium() {
    static std::atomic<bool> initialized{false};
    if (initialized.load()) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized.store(true);
    return true;
}

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() = default;

Result Sha256Hasher::initialize() {
    if (!initialize_sodium()) {
        return Result(ErrorCode::INVALID_STATE, "libsodium unavailable");
    }

    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return Result(ErrorCode::INVALID_STATE, "Failed to initialize SHA-256 hasher");
    }

    initialized_ = true;
    return Result();
}

Result Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return Result(ErrorCode::INVALID_STATE, "Failed to update hash");
    }

    return Result();
}

Result Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher not initialized");
    }

    if (output.size() < SHA256_DIGEST_SIZE) {
        return Result(ErrorCode::VALIDATION_ERROR, "Output buffer too small");
    }

    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return Result(ErrorCode::INVALID_STATE, "Failed to finalize hash");
    }

    initialized_ = false; // consumed
    return Result();
}

Sha256Digest Sha256Hasher::finalize() {
    Sha256Digest result;
    auto hash_result = finalize(std::span(result));
    if (!hash_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + hash_result.message);
    }
    return result;
}

Sha256Digest Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Digest result;
    initialize_sodium();
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

Result Sha256Hasher::hash_file(const std::filesystem::path& file_path, Sha256Digest& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::STORAGE_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string digest_to_hex(const Sha256Digest& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : digest) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Digest> digest_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    Sha256Digest digest;
    size_t bin_len = 0;
    if (sodium_hex2bin(digest.data(), digest.size(), hex_string.c_str(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != SHA256_DIGEST_SIZE) {
        return std::nullopt;
    }

    return digest;
}

std::string checksum_hex(std::span<const std::uint8_t> data) {
    return digest_to_hex(Sha256Hasher::hash(data));
}

bool verify_checksum(std::span<const std::uint8_t> data, const std::string& expected_hex) {
    auto expected = digest_from_hex(expected_hex);
    if (!expected) {
        return false;
    }

    auto actual = Sha256Hasher::hash(data);
    return sodium_memcmp(actual.data(), expected->data(), SHA256_DIGEST_SIZE) == 0;
}

}

} // namespace chunkvault::crypto
