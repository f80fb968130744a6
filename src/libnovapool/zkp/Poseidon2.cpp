#include <libnovapool/zkp/Poseidon2.h>

#include <stdexcept>
#include <utility>

namespace novapool {
namespace zkp {

namespace {

// zeroes[1..6] of the pool contract, starting from ZERO_LEAF
constexpr char const* knownZeroes[] = {
    "0x21f4ea2492ade006a8ee7fb764060a95a4eef5ca931e037bcdf05fc28067d008",
    "0x0ebfb4d2f05bb6a473c9bff72586fec806f1ac237015c570d7c78249cf7d7740",
    "0x066882a5dab186d4d63fa6600f9ea3d5cdfef2a2811c89731128a729d7e8b897",
    "0x065db3148d8da5329beaec5042785c69f2ce0709e26d468bda1e255c599b5686",
    "0x19926faa23b0737d467f9476f0f84b2968ff6666e16a23e4d44898f884504764",
    "0x287c485a72ccc8d4d80692d97eb62c164953a0422791f6af6214a9a7ad2279c0",
};

// Registered ASP member: private key, its leaf hash(pk, 0, 1), and the
// root of a depth 5 tree holding only that leaf at index 0.
constexpr char memberPrivateKey[] =
    "0x3625edaf29a00f40abaf4eb6b423c103287e4bc06f46a41472f5b186e277ea51";
constexpr char memberLeaf[] =
    "0x1e844e1b3284abb5bdad20ba0707f4c4053b6740814eb888658eb177d18ca2b2";
constexpr char memberRoot[] =
    "0x111e35f8c229c85e124f5e5653f4501a93bb8fcf0a724a0d15d985772dffda9d";

}  // namespace

FieldT
zeroLeaf()
{
    return fieldFromHex(ZERO_LEAF_HEX);
}

Poseidon2::Poseidon2(std::shared_ptr<Poseidon2Permutation const> permutation)
    : permutation_(std::move(permutation))
{
    if (!permutation_)
        throw std::invalid_argument("Poseidon2 requires a permutation");
}

FieldT
Poseidon2::first(std::vector<FieldT> state) const
{
    auto const width = state.size();
    auto out = permutation_->permute(state);
    if (out.size() != width)
        throw std::runtime_error("Poseidon2 permutation changed the state width");
    return out[0];
}

FieldT
Poseidon2::hash2(FieldT const& a, FieldT const& b, std::uint64_t dom) const
{
    return first({a, b, fieldFromU64(dom)});
}

FieldT
Poseidon2::hash3(
    FieldT const& a,
    FieldT const& b,
    FieldT const& c,
    std::uint64_t dom) const
{
    return first({a, b, c, fieldFromU64(dom)});
}

FieldT
Poseidon2::compress(FieldT const& left, FieldT const& right) const
{
    return first({left, right}) + left;
}

std::vector<FieldT>
Poseidon2::zeroes(FieldT const& leaf, std::size_t levels) const
{
    std::vector<FieldT> result;
    result.reserve(levels + 1);
    result.push_back(leaf);
    for (std::size_t i = 0; i < levels; ++i)
        result.push_back(compress(result.back(), result.back()));
    return result;
}

bool
Poseidon2::selfTest() const
{
    auto const chain = zeroes(zeroLeaf(), 6);
    for (std::size_t level = 1; level <= 6; ++level)
    {
        if (chain[level] != fieldFromHex(knownZeroes[level - 1]))
            return false;
    }

    auto const sk = fieldFromHex(memberPrivateKey);
    auto const pk = hash2(sk, FieldT::zero(), domain::keypair);
    auto const leaf = hash2(pk, FieldT::zero(), domain::leaf);
    if (leaf != fieldFromHex(memberLeaf))
        return false;

    FieldT node = leaf;
    for (std::size_t level = 0; level < 5; ++level)
        node = compress(node, chain[level]);
    return node == fieldFromHex(memberRoot);
}

}  // namespace zkp
}  // namespace novapool
