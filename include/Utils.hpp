#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>
#include "SecureTypes.hpp"

namespace garlic_shell {

class Utils {
public:
    // Hex helpers for keys, addresses and session ids
    static std::string toHex(const uint8_t* data, size_t length);
    static std::string toHex(const std::vector<uint8_t>& data);
    template <size_t N>
    static std::string toHex(const std::array<uint8_t, N>& data) {
        return toHex(data.data(), data.size());
    }
    // Returns nullopt on odd length or a non-hex digit
    static std::optional<std::vector<uint8_t>> fromHex(std::string_view hex);

    // Shortened form for log lines, e.g. "ab12cd34..."
    static std::string abbreviate(std::string_view value, size_t keep = 16);

    static uint64_t elapsedMillis(std::chrono::steady_clock::time_point since);

    // Splits "host:port"; throws ConfigError when malformed
    static std::pair<std::string, uint16_t> splitHostPort(std::string_view endpoint);

private:
    Utils() = delete;
};

} // namespace garlic_shell
