#include <libnovapool/zkp/PoolStore.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>

#include <algorithm>
#include <utility>

namespace novapool {
namespace zkp {

PoolStore::PoolStore(
    Poseidon2 hasher,
    std::size_t levels,
    std::size_t rootHistorySize,
    beast::Journal journal)
    : j_(journal), tree_(std::move(hasher), levels, zeroLeaf(), rootHistorySize)
{
}

PoolStore::ProcessResult
PoolStore::processEvents(std::vector<PoolEvent> const& events)
{
    ProcessResult result;
    for (auto const& event : events)
    {
        switch (event.kind)
        {
            case PoolEvent::Kind::NewCommitment:
                processNewCommitment(
                    event.commitment,
                    event.index,
                    event.encryptedOutput,
                    event.ledger);
                ++result.commitments;
                break;
            case PoolEvent::Kind::NewNullifier:
                processNewNullifier(event.nullifier, event.ledger);
                ++result.nullifiers;
                break;
        }
    }
    JLOG(j_.trace()) << "Processed " << result.commitments
                     << " commitments and " << result.nullifiers
                     << " nullifiers";
    return result;
}

void
PoolStore::processNewCommitment(
    FieldT const& commitment,
    std::uint64_t index,
    ripple::Blob const& encryptedOutput,
    std::uint32_t ledger)
{
    outputs_[index] = EncryptedOutputRecord{commitment, index, encryptedOutput, ledger};

    auto const known = leaves_.find(index);
    if (known != leaves_.end())
    {
        if (known->second.commitment == commitment)
            return;
        if (index < tree_.size())
            JLOG(j_.warn()) << "Conflicting commitment for leaf " << index
                            << ", local tree is stale";
        known->second = LeafRecord{commitment, ledger};
        return;
    }

    leaves_.emplace(index, LeafRecord{commitment, ledger});
    if (index != tree_.size())
    {
        JLOG(j_.warn()) << "Gap in leaf indices: expected " << tree_.size()
                        << ", got " << index << ", holding leaf back";
        return;
    }
    appendReady();
}

void
PoolStore::appendReady()
{
    for (auto it = leaves_.find(tree_.size()); it != leaves_.end() &&
         it->first == tree_.size();
         ++it)
        tree_.insert(it->second.commitment);
}

void
PoolStore::processNewNullifier(FieldT const& nullifier, std::uint32_t ledger)
{
    nullifiers_.emplace(fieldToUint256(nullifier), ledger);
}

std::size_t
PoolStore::rebuild()
{
    tree_.clear();
    appendReady();
    if (auto const held = pendingLeaves())
        JLOG(j_.warn()) << "Gap in leaf indices at " << tree_.size() << ", "
                        << held << " leaves held back";
    JLOG(j_.info()) << "Rebuilt pool tree with " << tree_.size() << " leaves";
    return tree_.size();
}

void
PoolStore::clear()
{
    tree_.clear();
    leaves_.clear();
    outputs_.clear();
    nullifiers_.clear();
}

MerkleProof
PoolStore::proof(std::uint64_t leafIndex) const
{
    auto proof = tree_.proof(leafIndex);
    JLOG(j_.debug()) << "Built proof for index " << leafIndex << " of "
                     << tree_.size();
    return proof;
}

bool
PoolStore::isNullifierSpent(FieldT const& nullifier) const
{
    return nullifiers_.count(fieldToUint256(nullifier)) != 0;
}

std::optional<std::uint32_t>
PoolStore::nullifierLedger(FieldT const& nullifier) const
{
    auto const it = nullifiers_.find(fieldToUint256(nullifier));
    if (it == nullifiers_.end())
        return std::nullopt;
    return it->second;
}

std::vector<EncryptedOutputRecord>
PoolStore::encryptedOutputs(std::uint32_t fromLedger) const
{
    std::vector<EncryptedOutputRecord> result;
    for (auto const& [index, record] : outputs_)
    {
        if (record.ledger >= fromLedger)
            result.push_back(record);
    }
    return result;
}

//------------------------------------------------------------------------------

AspMembershipStore::AspMembershipStore(
    Poseidon2 hasher,
    std::size_t levels,
    beast::Journal journal)
    : j_(journal), tree_(std::move(hasher), levels)
{
}

std::size_t
AspMembershipStore::processEvents(std::vector<LeafAddedEvent> const& events)
{
    std::size_t count = 0;
    for (auto const& event : events)
    {
        processLeafAdded(event);
        ++count;
    }
    return count;
}

void
AspMembershipStore::processLeafAdded(LeafAddedEvent const& event)
{
    // Already have it
    if (event.index < tree_.size())
        return;

    if (event.index != tree_.size())
        JLOG(j_.warn()) << "Gap in membership leaf indices: expected "
                        << tree_.size() << ", got " << event.index;
    tree_.insert(event.leaf);

    if (tree_.root() != event.root)
        JLOG(j_.warn()) << "Membership root after leaf " << event.index
                        << " differs from the contract's";
}

void
AspMembershipStore::clear()
{
    tree_.clear();
    JLOG(j_.info()) << "Cleared membership tree";
}

ripple::Blob
encodeAccountKey(FieldT const& notePk, X25519Key const& encryptionPk)
{
    auto const pk = fieldToBE(notePk);
    ripple::Blob key(pk.begin(), pk.end());
    key.insert(key.end(), encryptionPk.begin(), encryptionPk.end());
    return key;
}

PublicKeyStore::PublicKeyStore(beast::Journal journal) : j_(journal)
{
}

std::size_t
PublicKeyStore::processEvents(std::vector<PublicKeyEvent> const& events)
{
    std::size_t registrations = 0;
    for (auto const& event : events)
    {
        if (processPublicKeyEvent(event))
            ++registrations;
    }
    return registrations;
}

bool
PublicKeyStore::processPublicKeyEvent(PublicKeyEvent const& event)
{
    if (event.owner.empty() || event.key.size() != ACCOUNT_KEY_SIZE)
    {
        JLOG(j_.warn()) << "Skipping public key event for '" << event.owner
                        << "' with a " << event.key.size() << " byte key";
        return false;
    }

    PublicKeyRecord record;
    record.address = event.owner;
    record.ledger = event.ledger;
    FieldBytes pk;
    std::copy_n(event.key.begin(), pk.size(), pk.begin());
    try
    {
        record.noteKey = fieldFromBE(pk);
    }
    catch (PoolError const& e)
    {
        JLOG(j_.warn()) << "Skipping public key event for " << event.owner
                        << ": " << e.what();
        return false;
    }
    std::copy_n(
        event.key.begin() + pk.size(),
        record.encryptionKey.size(),
        record.encryptionKey.begin());

    auto const it = records_.find(event.owner);
    if (it != records_.end() && it->second.ledger > event.ledger)
    {
        JLOG(j_.debug()) << "Keeping newer registration for " << event.owner;
        return false;
    }
    records_[event.owner] = record;
    JLOG(j_.debug()) << "Stored public key for " << event.owner;
    return true;
}

std::optional<PublicKeyRecord>
PublicKeyStore::getByAddress(std::string const& address) const
{
    auto const it = records_.find(address);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<PublicKeyRecord>
PublicKeyStore::list(std::size_t limit) const
{
    std::vector<PublicKeyRecord> all;
    all.reserve(records_.size());
    for (auto const& [address, record] : records_)
        all.push_back(record);
    std::stable_sort(
        all.begin(), all.end(), [](auto const& a, auto const& b) {
            return a.ledger > b.ledger;
        });
    if (all.size() > limit)
        all.resize(limit);
    return all;
}

}  // namespace zkp
}  // namespace novapool
