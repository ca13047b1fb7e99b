#include "trustchain/crypto/Sha256.hpp"

#include <algorithm>
#include <bit>

namespace trustchain::crypto {

namespace {

constexpr std::array<std::uint32_t, 8> kInitialState{
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au, 0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

constexpr std::array<std::uint32_t, 64> kK{
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

Sha256::Sha256() {
    reset();
}

void Sha256::reset() {
    state_ = kInitialState;
    block_.fill(0);
    block_fill_ = 0;
    total_bytes_ = 0;
}

void Sha256::update(std::span<const std::uint8_t> data) {
    total_bytes_ += data.size();
    while (!data.empty()) {
        const auto take = std::min(kBlockBytes - block_fill_, data.size());
        std::copy_n(data.begin(), take, block_.begin() + static_cast<std::ptrdiff_t>(block_fill_));
        block_fill_ += take;
        data = data.subspan(take);
        if (block_fill_ == kBlockBytes) {
            compress_block();
            block_fill_ = 0;
        }
    }
}

void Sha256::update(std::string_view text) {
    update(as_bytes(text));
}

Digest Sha256::finalize() {
    const std::uint64_t bit_length = total_bytes_ * 8;

    // 0x80, zeros up to 56 mod 64, then the 64-bit big-endian length.
    std::array<std::uint8_t, kBlockBytes + 8> tail{};
    tail[0] = 0x80;
    const std::size_t zeros = (block_fill_ < 56 ? 56 - block_fill_ : 120 - block_fill_) - 1;
    for (int i = 0; i < 8; ++i) {
        tail[1 + zeros + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(bit_length >> (56 - 8 * i));
    }
    update(std::span<const std::uint8_t>(tail.data(), 1 + zeros + 8));

    Digest digest{};
    for (std::size_t word = 0; word < state_.size(); ++word) {
        for (std::size_t byte = 0; byte < 4; ++byte) {
            digest[word * 4 + byte] = static_cast<std::uint8_t>(state_[word] >> (24 - 8 * byte));
        }
    }
    reset();
    return digest;
}

void Sha256::compress_block() {
    std::array<std::uint32_t, 16> w{};
    for (std::size_t i = 0; i < w.size(); ++i) {
        w[i] = (static_cast<std::uint32_t>(block_[i * 4]) << 24) | (static_cast<std::uint32_t>(block_[i * 4 + 1]) << 16) |
               (static_cast<std::uint32_t>(block_[i * 4 + 2]) << 8) | static_cast<std::uint32_t>(block_[i * 4 + 3]);
    }

    auto v = state_;
    for (std::size_t round = 0; round < kK.size(); ++round) {
        // Message schedule kept as a rolling window of the last sixteen words.
        if (round >= 16) {
            const auto w15 = w[(round - 15) & 15];
            const auto w2 = w[(round - 2) & 15];
            const auto s0 = std::rotr(w15, 7) ^ std::rotr(w15, 18) ^ (w15 >> 3);
            const auto s1 = std::rotr(w2, 17) ^ std::rotr(w2, 19) ^ (w2 >> 10);
            w[round & 15] += s0 + w[(round - 7) & 15] + s1;
        }

        const auto [a, b, c, d, e, f, g, h] = v;
        const auto t1 = h + (std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25)) + ((e & f) ^ (~e & g)) + kK[round] +
                        w[round & 15];
        const auto t2 = (std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22)) + ((a & b) ^ (a & c) ^ (b & c));
        v = {t1 + t2, a, b, c, d + t1, e, f, g};
    }

    for (std::size_t i = 0; i < state_.size(); ++i) {
        state_[i] += v[i];
    }
}

Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Digest Sha256::digest(std::string_view text) {
    return digest(as_bytes(text));
}

std::string Sha256::hex_digest(std::string_view text) {
    return digest_to_string(digest(text));
}

}  // namespace trustchain::crypto
