#pragma once

#include <libnovapool/zkp/ChainGateway.h>
#include <libnovapool/zkp/IncrementalMerkleTree.h>
#include <libnovapool/zkp/KeyDerivation.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/beast/utility/Journal.h>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace novapool {
namespace zkp {

struct EncryptedOutputRecord
{
    FieldT commitment;
    std::uint64_t index = 0;
    ripple::Blob encryptedOutput;
    std::uint32_t ledger = 0;
};

/**
 * Local mirror of the pool contract: the commitment tree, the spent
 * nullifier set and the encrypted output log, fed from pool events.
 *
 * Replaying an event is harmless. A commitment for an index the tree
 * already holds is ignored when it matches and recorded otherwise, in
 * which case the tree stays stale until rebuild().
 *
 * Leaves always sit at their event index. A commitment that arrives
 * past a gap is held back and appended once the missing indices show
 * up, so nextIndex() stops at the first gap.
 */
class PoolStore
{
public:
    struct ProcessResult
    {
        std::size_t commitments = 0;
        std::size_t nullifiers = 0;
    };

    PoolStore(
        Poseidon2 hasher,
        std::size_t levels,
        std::size_t rootHistorySize,
        beast::Journal journal);

    ProcessResult
    processEvents(std::vector<PoolEvent> const& events);

    void
    processNewCommitment(
        FieldT const& commitment,
        std::uint64_t index,
        ripple::Blob const& encryptedOutput,
        std::uint32_t ledger);

    void
    processNewNullifier(FieldT const& nullifier, std::uint32_t ledger);

    /** Rebuild the tree from the recorded leaves up to the first gap. */
    std::size_t
    rebuild();

    /** Recorded commitments waiting behind a gap. */
    std::size_t
    pendingLeaves() const
    {
        return leaves_.size() - static_cast<std::size_t>(tree_.size());
    }

    /** Forget everything. */
    void
    clear();

    FieldT
    root() const
    {
        return tree_.root();
    }

    /** Throws IndexOutOfRange if the leaf is not in the tree. */
    MerkleProof
    proof(std::uint64_t leafIndex) const;

    bool
    isKnownRoot(FieldT const& root) const
    {
        return tree_.isKnownRoot(root);
    }

    bool
    isNullifierSpent(FieldT const& nullifier) const;

    /** Ledger in which the nullifier was revealed. */
    std::optional<std::uint32_t>
    nullifierLedger(FieldT const& nullifier) const;

    std::vector<EncryptedOutputRecord>
    encryptedOutputs(std::uint32_t fromLedger = 0) const;

    std::uint64_t
    nextIndex() const
    {
        return tree_.size();
    }

    std::size_t
    levels() const
    {
        return tree_.depth();
    }

    std::optional<std::uint64_t>
    indexOf(FieldT const& commitment) const
    {
        return tree_.indexOf(commitment);
    }

private:
    struct LeafRecord
    {
        FieldT commitment;
        std::uint32_t ledger;
    };

    void
    appendReady();

    beast::Journal j_;
    IncrementalMerkleTree tree_;
    std::map<std::uint64_t, LeafRecord> leaves_;
    std::map<std::uint64_t, EncryptedOutputRecord> outputs_;
    std::map<ripple::uint256, std::uint32_t> nullifiers_;
};

/**
 * Local mirror of the ASP membership tree, fed from LeafAdded events.
 */
class AspMembershipStore
{
public:
    AspMembershipStore(Poseidon2 hasher, std::size_t levels, beast::Journal journal);

    std::size_t
    processEvents(std::vector<LeafAddedEvent> const& events);

    void
    processLeafAdded(LeafAddedEvent const& event);

    FieldT
    root() const
    {
        return tree_.root();
    }

    MerkleProof
    proof(std::uint64_t leafIndex) const
    {
        return tree_.proof(leafIndex);
    }

    std::optional<std::uint64_t>
    indexOf(FieldT const& leaf) const
    {
        return tree_.indexOf(leaf);
    }

    std::uint64_t
    nextIndex() const
    {
        return tree_.size();
    }

    std::size_t
    levels() const
    {
        return tree_.depth();
    }

    void
    clear();

private:
    beast::Journal j_;
    IncrementalMerkleTree tree_;
};

/** Size of the key published by the pool contract's register call. */
constexpr std::size_t ACCOUNT_KEY_SIZE = 64;

/** Note public key (big-endian) followed by the X25519 encryption key. */
ripple::Blob
encodeAccountKey(FieldT const& notePk, X25519Key const& encryptionPk);

struct PublicKeyRecord
{
    std::string address;
    FieldT noteKey;
    X25519Key encryptionKey{};
    std::uint32_t ledger = 0;
};

/**
 * Address book built from the pool's PublicKeyEvents. A later
 * registration for the same address replaces the earlier one; events
 * whose key does not decode are logged and skipped.
 */
class PublicKeyStore
{
public:
    explicit PublicKeyStore(beast::Journal journal);

    /** Returns the number of registrations stored. */
    std::size_t
    processEvents(std::vector<PublicKeyEvent> const& events);

    bool
    processPublicKeyEvent(PublicKeyEvent const& event);

    std::optional<PublicKeyRecord>
    getByAddress(std::string const& address) const;

    /** Most recent registrations first, at most limit of them. */
    std::vector<PublicKeyRecord>
    list(std::size_t limit) const;

    std::size_t
    size() const
    {
        return records_.size();
    }

    void
    clear()
    {
        records_.clear();
    }

private:
    beast::Journal j_;
    std::map<std::string, PublicKeyRecord> records_;
};

}  // namespace zkp
}  // namespace novapool
