/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content fingerprinting for media files
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Instasave {

/**
 * @brief BLAKE3 hashing for media fingerprints
 *
 * A fingerprint detects corruption or duplication of an already-fetched
 * file under the same media_id. It is never used to merge different items.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 32; // 256 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 32-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Stream a file through the hasher
     * @param path File to hash
     * @param size_out If non-null, receives the number of bytes hashed
     * @throws std::runtime_error if the file cannot be read
     */
    static Hash hash_file(const std::filesystem::path& path, uint64_t* size_out = nullptr);

    /**
     * @brief Convert hash to lowercase hex string
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace Instasave
