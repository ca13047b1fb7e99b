#include "trustchain/crypto/HmacSha256.hpp"

#include "trustchain/crypto/Sha256.hpp"

#include <algorithm>
#include <numeric>

namespace trustchain::crypto {

namespace {

constexpr std::uint8_t kInnerPad = 0x36;
constexpr std::uint8_t kOuterPad = 0x5c;

using KeyBlock = std::array<std::uint8_t, HmacSha256::kBlockSize>;

std::span<const std::uint8_t> key_bytes(std::string_view key) {
    return {reinterpret_cast<const std::uint8_t*>(key.data()), key.size()};
}

// Keys longer than one block are replaced by their digest, shorter ones zero-padded.
KeyBlock normalize_key(std::span<const std::uint8_t> key) {
    KeyBlock block{};
    if (key.size() > block.size()) {
        const auto hashed = Sha256::digest(key);
        std::copy(hashed.begin(), hashed.end(), block.begin());
    } else {
        std::copy(key.begin(), key.end(), block.begin());
    }
    return block;
}

KeyBlock xor_pad(const KeyBlock& key, std::uint8_t pad) {
    KeyBlock padded{};
    std::transform(key.begin(), key.end(), padded.begin(), [pad](std::uint8_t byte) {
        return static_cast<std::uint8_t>(byte ^ pad);
    });
    return padded;
}

}  // namespace

Digest HmacSha256::compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    const auto block = normalize_key(key);

    Sha256 hasher;
    hasher.update(xor_pad(block, kInnerPad));
    hasher.update(data);
    const auto inner = hasher.finalize();

    hasher.update(xor_pad(block, kOuterPad));
    hasher.update(inner);
    return hasher.finalize();
}

Digest HmacSha256::compute(std::string_view key, std::span<const std::uint8_t> data) {
    return compute(key_bytes(key), data);
}

bool HmacSha256::verify(std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> data,
                        std::span<const std::uint8_t> mac) {
    if (mac.size() != kDigestSize) {
        return false;
    }
    const auto expected = compute(key, data);
    // Constant time.
    const auto difference = std::inner_product(
        expected.begin(), expected.end(), mac.begin(), std::uint8_t{0},
        [](std::uint8_t acc, std::uint8_t bit) { return static_cast<std::uint8_t>(acc | bit); },
        [](std::uint8_t lhs, std::uint8_t rhs) { return static_cast<std::uint8_t>(lhs ^ rhs); });
    return difference == 0;
}

bool HmacSha256::verify(std::string_view key, std::span<const std::uint8_t> data, std::span<const std::uint8_t> mac) {
    return verify(key_bytes(key), data, mac);
}

}  // namespace trustchain::crypto
