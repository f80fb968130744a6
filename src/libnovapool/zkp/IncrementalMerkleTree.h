#pragma once

#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/Poseidon2.h>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace novapool {
namespace zkp {

/**
 * Authentication path for one leaf.
 *
 * Bit j of pathIndices is 1 when the node at level j is a right child,
 * i.e. when pathElements[j] is the left sibling. For an append-only tree
 * this is the leaf index itself.
 */
struct MerkleProof
{
    std::vector<FieldT> pathElements;
    std::uint64_t pathIndices = 0;
    FieldT root;
};

/**
 * Incremental Merkle Tree
 *
 * Fixed-depth append-only tree over Poseidon2 compression, shaped like
 * the pool and ASP membership contracts. Key features:
 * - every computed node is kept per level, so insert and proof touch
 *   one node per level
 * - empty positions resolve to the cached zero-subtree chain
 * - an optional ring of recent roots mirrors the contract's history
 */
class IncrementalMerkleTree
{
public:
    static constexpr std::size_t MAX_DEPTH = 32;

    IncrementalMerkleTree(
        Poseidon2 hasher,
        std::size_t depth,
        FieldT const& emptyLeaf = zeroLeaf(),
        std::size_t rootHistorySize = 0);

    /** Append a leaf and return its index. Throws TreeFull. */
    std::uint64_t
    insert(FieldT const& leaf);

    std::vector<std::uint64_t>
    insertBatch(std::vector<FieldT> const& leaves);

    FieldT
    root() const;

    /** Throws IndexOutOfRange for an index that was never inserted. */
    MerkleProof
    proof(std::uint64_t index) const;

    FieldT
    leaf(std::uint64_t index) const;

    std::optional<std::uint64_t>
    indexOf(FieldT const& leaf) const;

    /** Recompute the root from a proof and compare. */
    bool
    verify(FieldT const& leaf, MerkleProof const& proof, FieldT const& root)
        const;

    /** True for the current root and the retained history; never for 0. */
    bool
    isKnownRoot(FieldT const& root) const;

    std::uint64_t
    size() const
    {
        return nodes_[0].size();
    }

    bool
    empty() const
    {
        return nodes_[0].empty();
    }

    std::uint64_t
    capacity() const
    {
        return std::uint64_t(1) << depth_;
    }

    std::size_t
    depth() const
    {
        return depth_;
    }

    /** zeroes()[i] is the root of an empty subtree of height i. */
    std::vector<FieldT> const&
    zeroes() const
    {
        return zeroes_;
    }

    void
    clear();

private:
    FieldT const&
    node(std::size_t level, std::uint64_t position) const;

    void
    setNode(std::size_t level, std::uint64_t position, FieldT const& value);

    void
    recordRoot();

    Poseidon2 hasher_;
    std::size_t depth_;
    std::size_t rootHistorySize_;

    // nodes_[level][position], level 0 holds the leaves
    std::vector<std::vector<FieldT>> nodes_;
    std::vector<FieldT> zeroes_;
    std::deque<FieldT> rootHistory_;
};

}  // namespace zkp
}  // namespace novapool
