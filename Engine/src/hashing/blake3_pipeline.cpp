/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace Instasave {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_file(const std::filesystem::path& path, uint64_t* size_out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file for hashing: " + path.string());
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);

    std::vector<char> buffer(1 << 16);
    uint64_t total = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(got));
            total += static_cast<uint64_t>(got);
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }

    Hash result;
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);
    if (size_out) *size_out = total;
    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

} // namespace Instasave
