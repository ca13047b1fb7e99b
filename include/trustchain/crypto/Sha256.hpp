#pragma once

#include "trustchain/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace trustchain::crypto {

// Streaming SHA-256 (FIPS 180-4). finalize() resets the hasher for reuse.
class Sha256 {
public:
    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);
    static Digest digest(std::string_view text);

    // Lowercase hex of digest(text).
    static std::string hex_digest(std::string_view text);

private:
    static constexpr std::size_t kBlockBytes = 64;

    void reset();
    void compress_block();

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, kBlockBytes> block_{};
    std::size_t block_fill_{0};
    std::uint64_t total_bytes_{0};
};

}  // namespace trustchain::crypto
