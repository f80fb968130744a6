#include <libnovapool/zkp/IncrementalMerkleTree.h>
#include <libnovapool/zkp/PoolError.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace novapool {
namespace zkp {

IncrementalMerkleTree::IncrementalMerkleTree(
    Poseidon2 hasher,
    std::size_t depth,
    FieldT const& emptyLeaf,
    std::size_t rootHistorySize)
    : hasher_(std::move(hasher))
    , depth_(depth)
    , rootHistorySize_(rootHistorySize)
{
    if (depth == 0)
        throw std::invalid_argument("Tree depth must be positive");
    if (depth > MAX_DEPTH)
        throw std::invalid_argument("Tree depth too large");

    nodes_.resize(depth_ + 1);
    zeroes_ = hasher_.zeroes(emptyLeaf, depth_);
    recordRoot();
}

FieldT const&
IncrementalMerkleTree::node(std::size_t level, std::uint64_t position) const
{
    auto const& row = nodes_[level];
    if (position < row.size())
        return row[position];
    return zeroes_[level];
}

void
IncrementalMerkleTree::setNode(
    std::size_t level,
    std::uint64_t position,
    FieldT const& value)
{
    auto& row = nodes_[level];
    if (position < row.size())
        row[position] = value;
    else if (position == row.size())
        row.push_back(value);
    else
        throw std::logic_error("Merkle tree level written out of order");
}

void
IncrementalMerkleTree::recordRoot()
{
    if (rootHistorySize_ == 0)
        return;
    rootHistory_.push_back(root());
    while (rootHistory_.size() > rootHistorySize_)
        rootHistory_.pop_front();
}

std::uint64_t
IncrementalMerkleTree::insert(FieldT const& leaf)
{
    std::uint64_t const index = size();
    if (index >= capacity())
        throw PoolError(
            ErrorCode::TreeFull,
            "Merkle tree of depth " + std::to_string(depth_) + " is full");

    setNode(0, index, leaf);

    std::uint64_t position = index;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        std::uint64_t const parent = position >> 1;
        auto const& left = node(level, parent << 1);
        auto const& right = node(level, (parent << 1) | 1);
        setNode(level + 1, parent, hasher_.compress(left, right));
        position = parent;
    }

    recordRoot();
    return index;
}

std::vector<std::uint64_t>
IncrementalMerkleTree::insertBatch(std::vector<FieldT> const& leaves)
{
    if (leaves.size() > capacity() - size())
        throw PoolError(
            ErrorCode::TreeFull,
            "Batch of " + std::to_string(leaves.size()) +
                " leaves does not fit");

    std::vector<std::uint64_t> indices;
    indices.reserve(leaves.size());
    for (auto const& leaf : leaves)
        indices.push_back(insert(leaf));
    return indices;
}

FieldT
IncrementalMerkleTree::root() const
{
    return node(depth_, 0);
}

MerkleProof
IncrementalMerkleTree::proof(std::uint64_t index) const
{
    if (index >= size())
        throw PoolError(
            ErrorCode::IndexOutOfRange,
            "Leaf index " + std::to_string(index) + " not in tree of size " +
                std::to_string(size()));

    MerkleProof result;
    result.pathElements.reserve(depth_);
    result.pathIndices = index;

    std::uint64_t position = index;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        result.pathElements.push_back(node(level, position ^ 1));
        position >>= 1;
    }
    result.root = root();
    return result;
}

FieldT
IncrementalMerkleTree::leaf(std::uint64_t index) const
{
    if (index >= size())
        throw PoolError(
            ErrorCode::IndexOutOfRange,
            "Leaf index " + std::to_string(index) + " not in tree");
    return nodes_[0][index];
}

std::optional<std::uint64_t>
IncrementalMerkleTree::indexOf(FieldT const& leaf) const
{
    auto const& leaves = nodes_[0];
    auto const it = std::find(leaves.begin(), leaves.end(), leaf);
    if (it == leaves.end())
        return std::nullopt;
    return static_cast<std::uint64_t>(it - leaves.begin());
}

bool
IncrementalMerkleTree::verify(
    FieldT const& leaf,
    MerkleProof const& proof,
    FieldT const& expectedRoot) const
{
    if (proof.pathElements.size() != depth_)
        return false;
    if (depth_ < 64 && (proof.pathIndices >> depth_) != 0)
        return false;

    FieldT current = leaf;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        auto const& sibling = proof.pathElements[level];
        if ((proof.pathIndices >> level) & 1)
            current = hasher_.compress(sibling, current);
        else
            current = hasher_.compress(current, sibling);
    }
    return current == expectedRoot;
}

bool
IncrementalMerkleTree::isKnownRoot(FieldT const& candidate) const
{
    if (candidate == FieldT::zero())
        return false;
    if (candidate == root())
        return true;
    return std::find(rootHistory_.begin(), rootHistory_.end(), candidate) !=
        rootHistory_.end();
}

void
IncrementalMerkleTree::clear()
{
    for (auto& row : nodes_)
        row.clear();
    rootHistory_.clear();
    recordRoot();
}

}  // namespace zkp
}  // namespace novapool
