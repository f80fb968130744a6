#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace novapool {
namespace zkp {

using Keccak256Digest = std::array<std::uint8_t, 32>;

/**
 * Keccak-256 as used by Ethereum and Soroban's env.crypto().keccak256:
 * Keccak-f[1600], rate 136 bytes, padding byte 0x01 (not the FIPS 202
 * SHA3 0x06).
 */
class Keccak256
{
public:
    Keccak256();

    void
    update(std::uint8_t const* data, std::size_t size);

    Keccak256Digest
    finish();

private:
    static void
    permute(std::uint64_t state[5][5]);

    void
    absorbBlock();

    static constexpr std::size_t rate_ = 136;

    std::uint64_t state_[5][5];
    std::uint8_t buffer_[rate_];
    std::size_t used_;
};

Keccak256Digest
keccak256(std::uint8_t const* data, std::size_t size);

Keccak256Digest
keccak256(std::vector<std::uint8_t> const& data);

}  // namespace zkp
}  // namespace novapool
