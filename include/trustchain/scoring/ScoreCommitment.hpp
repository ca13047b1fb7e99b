#pragma once

#include "trustchain/Types.hpp"
#include "trustchain/scoring/Scoring.hpp"

#include <string>

namespace trustchain::scoring {

// "code|time|peer|final", each printed with exactly two decimals ("%.2f").
std::string commitment_payload(const ComponentScores& scores);

Digest compute_commitment(const ComponentScores& scores);

// Lowercase hex SHA-256 of commitment_payload(scores).
std::string commitment_hex(const ComponentScores& scores);

// Case-insensitive comparison against a previously published commitment.
bool verify_commitment(const ComponentScores& scores, const std::string& published_hex);

}  // namespace trustchain::scoring
