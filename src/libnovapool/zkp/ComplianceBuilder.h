#pragma once

#include <libnovapool/zkp/ChainGateway.h>
#include <libnovapool/zkp/PoolStore.h>
#include <libnovapool/zkp/SparseMerkleTree.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <vector>

namespace novapool {
namespace zkp {

/** Proof that a user's leaf is in the ASP membership tree. */
struct MembershipProofData
{
    FieldT leaf;
    FieldT blinding;
    std::uint64_t pathIndices = 0;
    std::vector<FieldT> pathElements;
    FieldT root;

    /** Circuit shape, decimal strings. */
    Json::Value
    toJson() const;
};

Json::Value
nonMembershipProofJson(NonMembershipProof const& proof);

/**
 * Builds the per-input compliance proofs: inclusion of the user in the
 * ASP membership tree (from the locally synced copy) and exclusion
 * from the ASP non-membership tree (from the chain).
 */
class ComplianceBuilder
{
public:
    ComplianceBuilder(
        Poseidon2 hasher,
        AspMembershipStore const& membership,
        ChainGateway& gateway,
        std::size_t smtLevels,
        beast::Journal journal);

    /** Poseidon2(pk, blinding, leaf) */
    FieldT
    membershipLeaf(FieldT const& pk, FieldT const& blinding) const;

    /**
     * Membership proof for pk registered with blinding.
     *
     * A local root that differs from expectedRoot is logged and the local
     * root is used; the contract decides which roots it accepts.
     *
     * @throws PoolError(NotRegistered) if the leaf is not in the tree
     */
    MembershipProofData
    membershipProof(
        FieldT const& pk,
        FieldT const& blinding,
        std::uint64_t leafIndex,
        FieldT const& expectedRoot) const;

    /**
     * Non-membership proof for pk against expectedRoot. A zero root
     * yields the canonical empty proof without asking the chain.
     *
     * @throws PoolError(Sanctioned) if pk is in the tree
     * @throws PoolError(RootMismatch) if the chain's root is not
     *         expectedRoot or the returned path does not hash to it
     */
    NonMembershipProof
    nonMembershipProof(FieldT const& pk, FieldT const& expectedRoot);

    std::size_t
    smtLevels() const
    {
        return smtLevels_;
    }

private:
    Poseidon2 hasher_;
    AspMembershipStore const& membership_;
    ChainGateway& gateway_;
    std::size_t smtLevels_;
    beast::Journal j_;
};

}  // namespace zkp
}  // namespace novapool
