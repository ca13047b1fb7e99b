#pragma once

#include "trustchain/Types.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace trustchain::crypto {

class HmacSha256 {
public:
    static constexpr std::size_t kBlockSize = 64;
    static constexpr std::size_t kDigestSize = 32;

    static Digest compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
    static Digest compute(std::string_view key, std::span<const std::uint8_t> data);

    static bool verify(std::span<const std::uint8_t> key,
                       std::span<const std::uint8_t> data,
                       std::span<const std::uint8_t> mac);
    static bool verify(std::string_view key, std::span<const std::uint8_t> data, std::span<const std::uint8_t> mac);
};

}  // namespace trustchain::crypto
