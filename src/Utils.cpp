#include "Utils.hpp"
#include "Errors.hpp"
#include <charconv>

namespace garlic_shell {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789abcdef";

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string Utils::toHex(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string Utils::toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> Utils::fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string Utils::abbreviate(std::string_view value, size_t keep) {
    if (value.size() <= keep) {
        return std::string(value);
    }
    return std::string(value.substr(0, keep)) + "...";
}

uint64_t Utils::elapsedMillis(std::chrono::steady_clock::time_point since) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

std::pair<std::string, uint16_t> Utils::splitHostPort(std::string_view endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == endpoint.size()) {
        throw ConfigError("Expected host:port, got '" + std::string(endpoint) + "'");
    }

    std::string_view portText = endpoint.substr(colon + 1);
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (ec != std::errc() || ptr != portText.data() + portText.size() || port == 0 || port > 65535) {
        throw ConfigError("Invalid port in '" + std::string(endpoint) + "'");
    }

    return {std::string(endpoint.substr(0, colon)), static_cast<uint16_t>(port)};
}

} // namespace garlic_shell
