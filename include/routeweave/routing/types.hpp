#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace routeweave::routing {

using Bytes = std::vector<std::uint8_t>;

// Opaque content-derived key, normally a multihash.
class ContentId {
public:
    ContentId() = default;
    explicit ContentId(Bytes multihash) : bytes_(std::move(multihash)) {}
    
    // Throws std::invalid_argument on odd length or non-hex input.
    static ContentId from_hex(const std::string& hex);
    
    std::string to_hex() const;
    const Bytes& bytes() const { return bytes_; }
    std::span<const std::uint8_t> span() const { return std::span(bytes_); }
    bool defined() const { return !bytes_.empty(); }
    
    bool operator==(const ContentId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ContentId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const ContentId& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

struct AddrInfo {
    std::string peer_id;
    std::vector<std::string> addresses;
    
    bool empty() const { return peer_id.empty(); }
    
    bool operator==(const AddrInfo& other) const {
        return peer_id == other.peer_id && addresses == other.addresses;
    }
};

struct RoutingOptions {
    // Allow returning records that are known to be expired.
    bool expired = false;
    // Answer from local state only.
    bool offline = false;
    std::map<std::string, std::string> other;
};

}

template<>
struct std::hash<routeweave::routing::ContentId> {
    std::size_t operator()(const routeweave::routing::ContentId& cid) const noexcept {
        std::size_t seed = 0;
        for (auto byte : cid.bytes()) {
            seed ^= static_cast<std::size_t>(byte) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
