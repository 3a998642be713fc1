/**
 * @file path_resolver.hpp
 * @brief Deterministic storage paths for media items
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace Instasave {

/**
 * @brief Where an item lives relative to the media root, plus the slot its
 * fingerprint is written into once the bytes are committed.
 */
struct ResolvedTarget {
    std::string relative_path;   // YYYY-MM-DD/<media_id>_<index>.<ext>
    std::string extension;
    std::optional<BLAKE3Pipeline::Hash> fingerprint;
};

/**
 * @brief Pure mapping from item identity to storage path.
 *
 * The path depends only on (capture date, media_id, index, content type);
 * captions and source filenames are never consulted.
 */
class PathResolver {
public:
    static ResolvedTarget resolve(const std::string& capture_date,
                                  const std::string& media_id,
                                  uint32_t index,
                                  const std::string& content_type);

    /**
     * @brief Extension for a MIME type, "bin" when unknown or absent.
     */
    static std::string extension_for(const std::string& content_type);

    /**
     * @brief media_id with every byte outside [A-Za-z0-9_-] escaped as %XX.
     *
     * Injective: distinct ids never map to the same name. The empty id maps to "%".
     */
    static std::string sanitize_component(const std::string& media_id);
};

} // namespace Instasave
