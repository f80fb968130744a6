#pragma once

#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/Poseidon2.h>
#include <xrpl/basics/base_uint.h>
#include <map>
#include <vector>

namespace novapool {
namespace zkp {

/** Outcome of walking the tree along a key's bits. */
struct SmtFindResult
{
    bool found = false;
    std::vector<FieldT> siblings;
    FieldT foundValue = FieldT::zero();
    // Leaf met instead of the key, or the key itself when isOld0
    FieldT notFoundKey = FieldT::zero();
    FieldT notFoundValue = FieldT::zero();
    bool isOld0 = false;
};

/** Transition produced by insert or update. */
struct SmtUpdateResult
{
    FieldT oldRoot;
    FieldT newRoot;
    std::vector<FieldT> siblings;
    FieldT oldKey;
    FieldT oldValue;
    FieldT newKey;
    FieldT newValue;
    bool isOld0 = false;
};

/**
 * Non-membership proof in the shape consumed by the circuit's
 * SMT verifier: either the path ends in an empty slot (isOld0) or in a
 * leaf holding a different key.
 */
struct NonMembershipProof
{
    FieldT key;
    FieldT oldKey;
    FieldT oldValue;
    bool isOld0 = false;
    std::vector<FieldT> siblings;
    FieldT root;
};

/**
 * Sparse Merkle tree keyed by field elements.
 *
 * Nodes are stored by hash. The empty tree has root 0; a single leaf is
 * its own root; internal nodes are compress(left, right) and a leaf is
 * Poseidon2(key, value, leaf). Keys are walked least significant bit
 * first.
 */
class SparseMerkleTree
{
public:
    explicit SparseMerkleTree(Poseidon2 hasher);

    FieldT
    root() const
    {
        return root_;
    }

    bool
    empty() const
    {
        return root_ == FieldT::zero();
    }

    SmtFindResult
    find(FieldT const& key) const;

    /** Throws std::invalid_argument when the key is present. */
    SmtUpdateResult
    insert(FieldT const& key, FieldT const& value);

    /** Throws std::invalid_argument when the key is absent. */
    SmtUpdateResult
    update(FieldT const& key, FieldT const& value);

    /** find() with siblings padded with zeros to exactly levels entries. */
    SmtFindResult
    proof(FieldT const& key, std::size_t levels) const;

    /**
     * Proof that key is absent, padded to levels siblings.
     *
     * @throws PoolError(Sanctioned) when the key is in the tree.
     */
    NonMembershipProof
    nonMembershipProof(FieldT const& key, std::size_t levels) const;

    /** Proof against the empty tree: {key, 0, 0, isOld0, [0; levels], 0}. */
    static NonMembershipProof
    emptyProof(FieldT const& key, std::size_t levels);

    static bool
    verifyNonMembership(Poseidon2 const& hasher, NonMembershipProof const& proof);

    FieldT
    hashLeaf(FieldT const& key, FieldT const& value) const;

private:
    struct Node
    {
        bool leaf;
        // key and value for leaves, left and right child for internal nodes
        FieldT first;
        FieldT second;
    };

    Node const*
    getNode(FieldT const& hash) const;

    void
    putNode(FieldT const& hash, Node const& node);

    FieldT
    rebuildPath(
        FieldT current,
        std::vector<FieldT> const& siblings,
        std::vector<bool> const& keyBits);

    Poseidon2 hasher_;
    FieldT root_;
    std::map<ripple::uint256, Node> db_;
};

/** The 256 bits of a field element, least significant first. */
std::vector<bool>
fieldBits(FieldT const& x);

}  // namespace zkp
}  // namespace novapool
