/**
 * TOLLGATE - Resilient LLM Provider Client
 * Payload Compression - zlib deflate for cached payloads
 */

#ifndef TOLLGATE_CACHE_COMPRESSION_HPP
#define TOLLGATE_CACHE_COMPRESSION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tollgate::cache {

/**
 * Compression settings
 */
struct CompressionConfig {
    std::size_t threshold_bytes{1024};   // Payloads below this are stored raw
    int level{6};                        // zlib level 1..9
};

/**
 * Compress a payload if it is at least threshold_bytes long and the result
 * is smaller than the input.
 *
 * @return Compressed bytes, or nullopt to store raw
 */
std::optional<std::string> try_compress(std::string_view data, const CompressionConfig& config);

/**
 * Inflate a payload produced by try_compress
 *
 * @param data Compressed bytes
 * @param original_size Exact size of the uncompressed payload
 * @return Original bytes, or nullopt if the data is corrupt
 */
std::optional<std::string> decompress(std::string_view data, std::size_t original_size);

} // namespace tollgate::cache

#endif // TOLLGATE_CACHE_COMPRESSION_HPP
