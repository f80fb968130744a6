#pragma once

#include <libnovapool/zkp/Field.h>
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace novapool {
namespace zkp {

/**
 * Poseidon2 permutation over BN254, as instantiated by the circuit.
 *
 * The permutation itself is provided by the circuit package; this
 * library only builds the sponge/compression modes on top of it.
 * Implementations must support state widths 2, 3 and 4.
 */
class Poseidon2Permutation
{
public:
    virtual ~Poseidon2Permutation() = default;

    virtual std::vector<FieldT>
    permute(std::vector<FieldT> const& state) const = 0;
};

/** Domain separation tags used by the circuit gadgets. */
namespace domain {
constexpr std::uint64_t leaf = 1;
constexpr std::uint64_t commitment = 1;
constexpr std::uint64_t nullifier = 2;
constexpr std::uint64_t keypair = 3;
constexpr std::uint64_t signature = 4;
}  // namespace domain

/** Empty-slot leaf of the pool and membership trees (big-endian hex). */
constexpr char ZERO_LEAF_HEX[] =
    "0x25302288db99350344974183ce310d63b53abb9ef0f8575753eed36e0118f9ce";

FieldT
zeroLeaf();

class Poseidon2
{
public:
    explicit Poseidon2(std::shared_ptr<Poseidon2Permutation const> permutation);

    /** perm_t3([a, b, dom])[0] */
    FieldT
    hash2(FieldT const& a, FieldT const& b, std::uint64_t dom) const;

    /** perm_t4([a, b, c, dom])[0] */
    FieldT
    hash3(
        FieldT const& a,
        FieldT const& b,
        FieldT const& c,
        std::uint64_t dom) const;

    /** perm_t2([left, right])[0] + left, used for Merkle internal nodes. */
    FieldT
    compress(FieldT const& left, FieldT const& right) const;

    /**
     * Zero-subtree roots: zeroes[0] = leaf, zeroes[i+1] =
     * compress(zeroes[i], zeroes[i]). Returns levels + 1 entries.
     */
    std::vector<FieldT>
    zeroes(FieldT const& leaf, std::size_t levels) const;

    /**
     * Compare against vectors produced by the deployed contracts and
     * circuit. Returns false when the permutation does not match.
     */
    bool
    selfTest() const;

private:
    FieldT
    first(std::vector<FieldT> state) const;

    std::shared_ptr<Poseidon2Permutation const> permutation_;
};

}  // namespace zkp
}  // namespace novapool
