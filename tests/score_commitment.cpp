#include "trustchain/crypto/HmacSha256.hpp"
#include "trustchain/crypto/Sha256.hpp"
#include "trustchain/scoring/ScoreCommitment.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <span>
#include <string>
#include <string_view>

using namespace trustchain;
using namespace trustchain::scoring;

int main() {
    assert(crypto::Sha256::hex_digest("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    const std::string_view message = "what do ya want for nothing?";
    const auto mac = crypto::HmacSha256::compute(
        "Jefe", std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(message.data()), message.size()));
    assert(digest_to_string(mac) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    const ComponentScores scores{80.0, 60.0, 50.0, 65.0};
    assert(commitment_payload(scores) == "80.00|60.00|50.00|65.00");

    const auto hex = commitment_hex(scores);
    assert(hex == "43327fcb94d0c6dd0cf9db425e55b0276b3103367010c27e85dbe93fca63c842");
    assert(commitment_hex(ComponentScores{80.0, 60.0, 50.0, 65.0}) == hex);

    const ComponentScores tuned{72.5, 70.0, 87.5, 76.75};
    assert(commitment_hex(tuned) == "d66a5c80eca85424f1d05d272cd4f7950aaf600e6e69f02ae1b05750bbd22f61");

    // A one-cent change in any component changes the hash.
    assert(commitment_hex(ComponentScores{80.01, 60.0, 50.0, 65.0}) != hex);
    assert(commitment_hex(ComponentScores{80.0, 60.0, 50.0, 65.01}) != hex);

    assert(verify_commitment(scores, hex));
    std::string upper = hex;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    assert(verify_commitment(scores, upper));
    assert(!verify_commitment(tuned, hex));
    assert(!verify_commitment(scores, "not-hex"));
    assert(!verify_commitment(scores, hex.substr(0, 62)));

    // Only plain hex digits are accepted; "+c" or " c" must not stand in for "0c".
    assert(hex.substr(16, 2) == "0c");
    std::string signed_byte = hex;
    signed_byte[16] = '+';
    assert(!verify_commitment(scores, signed_byte));
    std::string spaced_byte = hex;
    spaced_byte[16] = ' ';
    assert(!verify_commitment(scores, spaced_byte));

    const std::string zeros(62, '0');
    const auto parsed = digest_from_string("0f" + zeros);
    assert(parsed.has_value());
    assert((*parsed)[0] == 0x0f);
    assert(!digest_from_string("+f" + zeros).has_value());
    assert(!digest_from_string(" f" + zeros).has_value());
    assert(!digest_from_string("0x" + zeros).has_value());

    // Half-cent ties round to even, matching the two-decimal payload.
    const ComponentScores tie{0.0, 0.0, compute_peer_vote_score({1, 1, 1, 1, 1, 1, 1, 2}), 0.0};
    assert(commitment_payload(tie) == "0.00|0.00|3.12|0.00");
    assert(verify_commitment(tie, commitment_hex(ComponentScores{0.0, 0.0, 3.12, 0.0})));
    return 0;
}
