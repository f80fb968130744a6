#pragma once

#include <libnovapool/zkp/ChainGateway.h>
#include <libnovapool/zkp/ComplianceBuilder.h>
#include <libnovapool/zkp/Config.h>
#include <libnovapool/zkp/KeyDerivation.h>
#include <libnovapool/zkp/NoteScanner.h>
#include <libnovapool/zkp/NoteStore.h>
#include <libnovapool/zkp/PoolStore.h>
#include <libnovapool/zkp/ProverClient.h>
#include <libnovapool/zkp/Signer.h>
#include <libnovapool/zkp/WitnessBuilder.h>
#include <xrpl/beast/utility/Journal.h>
#include <optional>
#include <string>
#include <vector>

namespace novapool {
namespace zkp {

/** Where the user's leaf sits in the ASP membership tree. */
struct MembershipRegistration
{
    FieldT blinding = FieldT::zero();
    std::uint64_t leafIndex = 0;
};

struct TransactionResult
{
    std::string txHash;
    std::optional<std::uint32_t> ledger;
    WitnessResult witness;
    ProveResult proof;
    OnChainProof onChain;
    // Own non-dummy outputs that were stored
    std::vector<StoredNote> storedOutputs;
};

/**
 * Deposit, withdraw and transfer flows.
 *
 * Each flow syncs the local trees, builds the witness, proves, checks
 * the proof locally and submits it. Local state changes only after the
 * chain accepted the transaction.
 */
class TransactionService
{
public:
    TransactionService(
        PoolConfig const& config,
        Poseidon2 hasher,
        Signer& signer,
        ChainGateway& gateway,
        ProverClient& prover,
        NoteStore& notes,
        beast::Journal journal);

    /** Derive keys through the signer, once per session. */
    UserKeys const&
    unlock();

    bool
    isUnlocked() const
    {
        return keys_.has_value();
    }

    void
    setMembershipRegistration(MembershipRegistration const& registration)
    {
        registration_ = registration;
    }

    /**
     * Bring the pool tree up to date. When its root differs from the
     * contract's the tree is rebuilt from events.
     *
     * @throws PoolError(RootMismatch) if the rebuilt tree still differs
     */
    void
    syncPool();

    void
    syncMembership();

    /** Returns the number of registrations processed. */
    std::size_t
    syncPublicKeys();

    /**
     * Publish the user's note and encryption keys under their address
     * so others can transfer to it. Returns the transaction hash.
     *
     * @throws PoolError(ChainError) if the contract rejects it
     */
    std::string
    registerPublicKey();

    /** Sync and scan for notes addressed to the user. */
    NoteScanner::ScanResult
    scanNotes();

    /**
     * Deposit amount from the user's account. Outputs default to a
     * single note of amount to self.
     */
    TransactionResult
    deposit(Amount const& amount, std::vector<OutputRequest> outputs = {});

    /** Withdraw amount from notes to a G... or C... address. */
    TransactionResult
    withdraw(
        std::vector<StoredNote> const& notes,
        Amount const& amount,
        std::string const& recipient);

    /** Send amount from notes to another user's keys inside the pool. */
    TransactionResult
    transfer(
        std::vector<StoredNote> const& notes,
        Amount const& amount,
        FieldT const& recipientPk,
        X25519Key const& recipientEncryptionPk);

    /**
     * Transfer to the keys registered for a chain address.
     *
     * @throws PoolError(MissingRecipientKey) if the address never
     *         registered
     */
    TransactionResult
    transfer(
        std::vector<StoredNote> const& notes,
        Amount const& amount,
        std::string const& recipientAddress);

    PoolStore&
    pool()
    {
        return pool_;
    }

    PoolStore const&
    pool() const
    {
        return pool_;
    }

    AspMembershipStore const&
    membership() const
    {
        return membership_;
    }

    PublicKeyStore const&
    publicKeys() const
    {
        return publicKeys_;
    }

private:
    TransactionResult
    execute(
        std::vector<StoredNote> const& notes,
        std::vector<OutputRequest> outputs,
        ExtData extData);

    std::vector<InputNote>
    prepareInputs(std::vector<StoredNote> const& notes) const;

    std::vector<StoredNote>
    persistOutputs(WitnessResult const& witness, std::uint32_t ledger);

    void
    requireAmount(Amount const& amount) const;

    PoolConfig config_;
    Poseidon2 hasher_;
    Signer& signer_;
    ChainGateway& gateway_;
    ProverClient& prover_;
    NoteStore& notes_;
    beast::Journal j_;

    PoolStore pool_;
    AspMembershipStore membership_;
    PublicKeyStore publicKeys_;
    ComplianceBuilder compliance_;
    WitnessBuilder builder_;
    NoteScanner scanner_;

    std::optional<UserKeys> keys_;
    MembershipRegistration registration_;
};

}  // namespace zkp
}  // namespace novapool
