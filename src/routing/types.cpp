#include "routeweave/routing/types.hpp"
#include <stdexcept>

namespace routeweave::routing {

namespace {
    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

ContentId ContentId::from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Content id has odd hex length");
    }
    
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Content id contains non-hex characters");
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    
    return ContentId(std::move(bytes));
}

std::string ContentId::to_hex() const {
    static constexpr char digits[] = "0123456789abcdef";
    
    std::string result;
    result.reserve(bytes_.size() * 2);
    for (auto byte : bytes_) {
        result.push_back(digits[byte >> 4]);
        result.push_back(digits[byte & 0x0F]);
    }
    return result;
}

}
