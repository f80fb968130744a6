#pragma once

#include <libnovapool/zkp/Poseidon2.h>

namespace novapool {
namespace test {

/**
 * Deterministic stand-in for the circuit's Poseidon2 permutation.
 *
 * Eight rounds of add-constant, x^5 and the (I + J) mix, for any state
 * width. It does not reproduce the deployed vectors, so selfTest()
 * fails with it.
 */
class TestPermutation : public zkp::Poseidon2Permutation
{
public:
    std::vector<zkp::FieldT>
    permute(std::vector<zkp::FieldT> const& state) const override;
};

/** Poseidon2 modes over TestPermutation. Initializes the curve. */
zkp::Poseidon2
testHasher();

}  // namespace test
}  // namespace novapool
