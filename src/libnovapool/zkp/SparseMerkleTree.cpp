#include <libnovapool/zkp/SparseMerkleTree.h>
#include <libnovapool/zkp/PoolError.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace novapool {
namespace zkp {

std::vector<bool>
fieldBits(FieldT const& x)
{
    auto const bytes = fieldToLE(x);
    std::vector<bool> bits;
    bits.reserve(256);
    for (std::size_t i = 0; i < 256; ++i)
        bits.push_back(((bytes[i / 8] >> (i % 8)) & 1) != 0);
    return bits;
}

SparseMerkleTree::SparseMerkleTree(Poseidon2 hasher)
    : hasher_(std::move(hasher)), root_(FieldT::zero())
{
}

FieldT
SparseMerkleTree::hashLeaf(FieldT const& key, FieldT const& value) const
{
    return hasher_.hash2(key, value, domain::leaf);
}

SparseMerkleTree::Node const*
SparseMerkleTree::getNode(FieldT const& hash) const
{
    auto const it = db_.find(fieldToUint256(hash));
    if (it == db_.end())
        return nullptr;
    return &it->second;
}

void
SparseMerkleTree::putNode(FieldT const& hash, Node const& node)
{
    if (hash != FieldT::zero())
        db_[fieldToUint256(hash)] = node;
}

SmtFindResult
SparseMerkleTree::find(FieldT const& key) const
{
    auto const keyBits = fieldBits(key);

    SmtFindResult result;
    FieldT current = root_;
    for (std::size_t level = 0;; ++level)
    {
        if (current == FieldT::zero())
        {
            result.notFoundKey = key;
            result.isOld0 = true;
            return result;
        }

        auto const* node = getNode(current);
        if (!node)
            throw std::logic_error("Sparse Merkle tree node missing");

        if (node->leaf)
        {
            if (node->first == key)
            {
                result.found = true;
                result.foundValue = node->second;
            }
            else
            {
                result.notFoundKey = node->first;
                result.notFoundValue = node->second;
            }
            return result;
        }

        if (level >= keyBits.size())
            throw std::logic_error("Sparse Merkle tree deeper than 256 levels");

        if (keyBits[level])
        {
            result.siblings.push_back(node->first);
            current = node->second;
        }
        else
        {
            result.siblings.push_back(node->second);
            current = node->first;
        }
    }
}

FieldT
SparseMerkleTree::rebuildPath(
    FieldT current,
    std::vector<FieldT> const& siblings,
    std::vector<bool> const& keyBits)
{
    for (std::size_t level = siblings.size(); level-- > 0;)
    {
        auto const& sibling = siblings[level];
        FieldT left = current;
        FieldT right = sibling;
        if (keyBits[level])
            std::swap(left, right);

        current = hasher_.compress(left, right);
        putNode(current, Node{false, left, right});
    }
    return current;
}

SmtUpdateResult
SparseMerkleTree::insert(FieldT const& key, FieldT const& value)
{
    auto const found = find(key);
    if (found.found)
        throw std::invalid_argument("Key already exists in sparse Merkle tree");

    auto const keyBits = fieldBits(key);

    SmtUpdateResult result;
    result.oldRoot = root_;
    result.oldKey = found.notFoundKey;
    result.oldValue = found.notFoundValue;
    result.newKey = key;
    result.newValue = value;
    result.isOld0 = found.isOld0;

    auto const leafHash = hashLeaf(key, value);
    putNode(leafHash, Node{true, key, value});

    auto siblings = found.siblings;
    if (!found.isOld0)
    {
        // extend the path until the two keys part ways, then hang the
        // existing leaf beside the new one
        auto const oldBits = fieldBits(found.notFoundKey);
        std::size_t level = siblings.size();
        while (level < keyBits.size() && oldBits[level] == keyBits[level])
        {
            siblings.push_back(FieldT::zero());
            ++level;
        }
        if (level == keyBits.size())
            throw std::logic_error("Distinct keys share all 256 bits");
        siblings.push_back(hashLeaf(found.notFoundKey, found.notFoundValue));
    }

    root_ = rebuildPath(leafHash, siblings, keyBits);
    result.newRoot = root_;

    while (!siblings.empty() && siblings.back() == FieldT::zero())
        siblings.pop_back();
    if (!found.isOld0 && !siblings.empty())
        siblings.pop_back();
    result.siblings = std::move(siblings);
    return result;
}

SmtUpdateResult
SparseMerkleTree::update(FieldT const& key, FieldT const& value)
{
    auto const found = find(key);
    if (!found.found)
        throw std::invalid_argument("Key does not exist in sparse Merkle tree");

    SmtUpdateResult result;
    result.oldRoot = root_;
    result.oldKey = key;
    result.oldValue = found.foundValue;
    result.newKey = key;
    result.newValue = value;
    result.isOld0 = false;

    auto const leafHash = hashLeaf(key, value);
    putNode(leafHash, Node{true, key, value});
    root_ = rebuildPath(leafHash, found.siblings, fieldBits(key));

    result.newRoot = root_;
    result.siblings = found.siblings;
    return result;
}

SmtFindResult
SparseMerkleTree::proof(FieldT const& key, std::size_t levels) const
{
    auto result = find(key);
    if (result.siblings.size() > levels)
        throw std::out_of_range(
            "Sparse Merkle path of " + std::to_string(result.siblings.size()) +
            " levels exceeds " + std::to_string(levels));
    result.siblings.resize(levels, FieldT::zero());
    return result;
}

NonMembershipProof
SparseMerkleTree::nonMembershipProof(FieldT const& key, std::size_t levels)
    const
{
    if (empty())
        return emptyProof(key, levels);

    auto const found = proof(key, levels);
    if (found.found)
        throw PoolError(
            ErrorCode::Sanctioned,
            "Public key is present in the non-membership tree");

    NonMembershipProof result;
    result.key = key;
    result.isOld0 = found.isOld0;
    result.oldKey = found.isOld0 ? FieldT::zero() : found.notFoundKey;
    result.oldValue = found.isOld0 ? FieldT::zero() : found.notFoundValue;
    result.siblings = found.siblings;
    result.root = root_;
    return result;
}

NonMembershipProof
SparseMerkleTree::emptyProof(FieldT const& key, std::size_t levels)
{
    NonMembershipProof result;
    result.key = key;
    result.oldKey = FieldT::zero();
    result.oldValue = FieldT::zero();
    result.isOld0 = true;
    result.siblings.assign(levels, FieldT::zero());
    result.root = FieldT::zero();
    return result;
}

bool
SparseMerkleTree::verifyNonMembership(
    Poseidon2 const& hasher,
    NonMembershipProof const& proof)
{
    if (!proof.isOld0 && proof.oldKey == proof.key)
        return false;

    auto siblings = proof.siblings;
    while (!siblings.empty() && siblings.back() == FieldT::zero())
        siblings.pop_back();

    auto const keyBits = fieldBits(proof.key);
    if (siblings.size() > keyBits.size())
        return false;

    // the old leaf must sit on the same path as key
    if (!proof.isOld0)
    {
        auto const oldBits = fieldBits(proof.oldKey);
        for (std::size_t level = 0; level < siblings.size(); ++level)
        {
            if (oldBits[level] != keyBits[level])
                return false;
        }
    }

    FieldT current = proof.isOld0
        ? FieldT::zero()
        : hasher.hash2(proof.oldKey, proof.oldValue, domain::leaf);
    for (std::size_t level = siblings.size(); level-- > 0;)
    {
        if (keyBits[level])
            current = hasher.compress(siblings[level], current);
        else
            current = hasher.compress(current, siblings[level]);
    }
    return current == proof.root;
}

}  // namespace zkp
}  // namespace novapool
