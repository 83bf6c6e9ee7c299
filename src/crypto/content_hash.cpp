#include "routeweave/crypto/content_hash.hpp"
#include "routeweave/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace routeweave::crypto {

bool initialize() {
    if (sodium_init() < 0) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return false;
    }
    return true;
}

ContentDigest digest(std::span<const std::uint8_t> data) {
    ContentDigest result;
    if (crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0) != 0) {
        throw std::runtime_error("Failed to compute content digest");
    }
    return result;
}

routing::ContentId content_id_for(std::span<const std::uint8_t> data) {
    auto hash = digest(data);

    routing::Bytes multihash;
    multihash.reserve(BLAKE2B_256_PREFIX.size() + hash.size());
    multihash.insert(multihash.end(), BLAKE2B_256_PREFIX.begin(), BLAKE2B_256_PREFIX.end());
    multihash.insert(multihash.end(), hash.begin(), hash.end());
    return routing::ContentId(std::move(multihash));
}

routing::ContentId content_id_for(const std::string& data) {
    return content_id_for(std::span(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

bool is_blake2b_content_id(const routing::ContentId& cid) {
    const auto& bytes = cid.bytes();
    if (bytes.size() != BLAKE2B_256_PREFIX.size() + CONTENT_DIGEST_SIZE) {
        return false;
    }
    return std::equal(BLAKE2B_256_PREFIX.begin(), BLAKE2B_256_PREFIX.end(), bytes.begin());
}

}
