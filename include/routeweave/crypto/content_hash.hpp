#pragma once

#include "routeweave/routing/types.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace routeweave::crypto {

constexpr std::size_t CONTENT_DIGEST_SIZE = 32;

// Multihash header for blake2b-256: varint(0xb220) followed by the digest length.
constexpr std::array<std::uint8_t, 4> BLAKE2B_256_PREFIX = {0xa0, 0xe4, 0x02, 0x20};

using ContentDigest = std::array<std::uint8_t, CONTENT_DIGEST_SIZE>;

// Must be called once before hashing. Safe to call repeatedly.
bool initialize();

ContentDigest digest(std::span<const std::uint8_t> data);

routing::ContentId content_id_for(std::span<const std::uint8_t> data);
routing::ContentId content_id_for(const std::string& data);

// True when cid carries a blake2b-256 multihash header and a full digest.
bool is_blake2b_content_id(const routing::ContentId& cid);

}
