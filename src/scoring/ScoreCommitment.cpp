#include "trustchain/scoring/ScoreCommitment.hpp"

#include "trustchain/crypto/Sha256.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace trustchain::scoring {

namespace {

constexpr char kSeparator = '|';

std::string format_cents(double value) {
    char buffer[64];
    const int written = std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    if (written <= 0) {
        return "0.00";
    }
    return std::string(buffer, static_cast<std::size_t>(std::min<int>(written, sizeof(buffer) - 1)));
}

}  // namespace

std::string commitment_payload(const ComponentScores& scores) {
    std::string payload;
    payload.reserve(32);
    payload += format_cents(scores.code);
    payload.push_back(kSeparator);
    payload += format_cents(scores.time);
    payload.push_back(kSeparator);
    payload += format_cents(scores.peer);
    payload.push_back(kSeparator);
    payload += format_cents(scores.final_score);
    return payload;
}

Digest compute_commitment(const ComponentScores& scores) {
    return crypto::Sha256::digest(commitment_payload(scores));
}

std::string commitment_hex(const ComponentScores& scores) {
    return digest_to_string(compute_commitment(scores));
}

bool verify_commitment(const ComponentScores& scores, const std::string& published_hex) {
    std::string normalized = published_hex;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    const auto published = digest_from_string(normalized);
    if (!published) {
        return false;
    }
    return *published == compute_commitment(scores);
}

}  // namespace trustchain::scoring
