/**
 * @file hash_utils.cpp
 * @brief OpenSSL-backed hashing and random token generation
 *
 * @date 2025
 */

#include "repoprobe/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <random>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace repoprobe {
namespace utils {

namespace {

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

std::string HashUtils::ToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return ToHex(digest, digest_len);
}

std::string HashUtils::RandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> buffer(num_bytes);
    if (num_bytes == 0) {
        return "";
    }

    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        spdlog::warn("RAND_bytes failed, falling back to std::random_device");
        std::random_device rd;
        std::uniform_int_distribution<int> dis(0, 255);
        for (auto& byte : buffer) {
            byte = static_cast<unsigned char>(dis(rd));
        }
    }

    return ToHex(buffer.data(), buffer.size());
}

} // namespace utils
} // namespace repoprobe
