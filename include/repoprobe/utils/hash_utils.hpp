/**
 * @file hash_utils.hpp
 * @brief Hashing and random identifier helpers backed by OpenSSL
 *
 * SHA-256 fingerprints of build inputs and collision-resistant random
 * tokens for ephemeral image tags.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace repoprobe {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 *
 * **Usage Example**:
 * @code
 * std::string fp = HashUtils::ComputeSHA256(dockerfile_text).substr(0, 12);
 * std::string tag = "repoprobe-analysis-" + HashUtils::RandomHex(6);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of an in-memory string
     * @return 64 lowercase hex characters
     * @throws std::runtime_error if the OpenSSL digest context fails
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Random token from the OpenSSL CSPRNG
     *
     * Falls back to std::random_device when RAND_bytes reports failure, so
     * the call always succeeds.
     *
     * @param num_bytes Entropy in bytes
     * @return 2 * num_bytes lowercase hex characters
     */
    static std::string RandomHex(std::size_t num_bytes);

    /// Lowercase hex encoding
    static std::string ToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace repoprobe
