/**
 * @file hash_utils.hpp
 * @brief Content hashing for image recipes
 *
 * Runtime images are tagged with a digest of the recipe they were built
 * from, so a changed recipe is detected as a missing image and rebuilt,
 * while an unchanged one is found locally and reused.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace faasbox {
namespace utils {

/**
 * @class HashUtils
 * @brief SHA-256 digests backed by OpenSSL EVP
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a string
     * @param data Input bytes
     * @return Lowercase hex digest (64 characters)
     * @throws std::runtime_error if the digest cannot be computed
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Shortened digest for use in image tags
     * @param data Input bytes
     * @param length Number of hex characters to keep
     */
    static std::string ShortDigest(const std::string& data, std::size_t length = 12);
};

} // namespace utils
} // namespace faasbox
