/**
 * TOLLGATE - Resilient LLM Provider Client
 * Payload Compression Implementation
 */

#include "cache/compression.hpp"

#include <zlib.h>

namespace tollgate::cache {

std::optional<std::string> try_compress(std::string_view data, const CompressionConfig& config) {
    if (data.empty() || data.size() < config.threshold_bytes) {
        return std::nullopt;
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::string compressed;
    compressed.resize(bound);

    int ret = compress2(reinterpret_cast<Bytef*>(compressed.data()), &bound,
                        reinterpret_cast<const Bytef*>(data.data()),
                        static_cast<uLong>(data.size()),
                        config.level);
    if (ret != Z_OK) {
        return std::nullopt;
    }

    compressed.resize(bound);

    // Only use compressed if it's actually smaller
    if (compressed.size() >= data.size()) {
        return std::nullopt;
    }

    return compressed;
}

std::optional<std::string> decompress(std::string_view data, std::size_t original_size) {
    std::string output;
    output.resize(original_size);

    uLongf out_len = static_cast<uLongf>(original_size);
    int ret = uncompress(reinterpret_cast<Bytef*>(output.data()), &out_len,
                         reinterpret_cast<const Bytef*>(data.data()),
                         static_cast<uLong>(data.size()));
    if (ret != Z_OK || out_len != original_size) {
        return std::nullopt;
    }

    return output;
}

} // namespace tollgate::cache
