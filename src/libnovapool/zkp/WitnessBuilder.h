#pragma once

#include <libnovapool/zkp/ComplianceBuilder.h>
#include <libnovapool/zkp/Config.h>
#include <libnovapool/zkp/ExtData.h>
#include <libnovapool/zkp/IncrementalMerkleTree.h>
#include <libnovapool/zkp/KeyDerivation.h>
#include <libnovapool/zkp/Note.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <array>
#include <optional>
#include <vector>

namespace novapool {
namespace zkp {

/** A note being spent, with its path in the pool tree. */
struct InputNote
{
    Note note;
    std::optional<MerkleProof> merkleProof;
};

struct OutputRequest
{
    Amount amount;
    // Random when absent
    std::optional<FieldT> blinding;
    // Sender's keys when absent
    std::optional<FieldT> recipientPk;
    // Required when recipientPk is someone else's and outputs are sealed
    std::optional<X25519Key> recipientEncryptionPk;
};

struct WitnessRequest
{
    FieldT sk;
    X25519Key encryptionPk{};
    FieldT poolRoot;
    FieldT membershipRoot;
    FieldT nonMembershipRoot;
    // Empty for deposits
    std::vector<InputNote> inputs;
    std::vector<OutputRequest> outputs;
    // encryptedOutput0/1 are overwritten
    ExtData extData;
    std::uint64_t membershipLeafIndex = 0;
    FieldT membershipBlinding = FieldT::zero();
    // Added to the blinding of every dummy input
    FieldT dummyNonce = FieldT::zero();
};

struct InputSlot
{
    Note note;
    FieldT commitment;
    FieldT nullifier;
    std::uint64_t pathIndices = 0;
    std::vector<FieldT> pathElements;
    bool dummy = true;
};

struct OutputSlot
{
    Note note;
    FieldT commitment;
    X25519Key encryptionPk{};
    // Owned by the sender, i.e. worth storing after submission
    bool toSelf = true;
};

struct WitnessResult
{
    Json::Value circuitInputs;
    std::array<InputSlot, N_INS> inputs;
    std::array<OutputSlot, N_OUTS> outputs;
    ExtData extData;
    ExtDataHash extDataHash;
    FieldT publicAmount;
    MembershipProofData membership;
    NonMembershipProof nonMembership;
};

/**
 * Assembles the transaction circuit's input from notes, outputs and
 * compliance state.
 *
 * All validation that the circuit would reject happens here first, so
 * a bad request fails with a precise error instead of a prover failure.
 */
class WitnessBuilder
{
public:
    WitnessBuilder(
        Poseidon2 hasher,
        ComplianceBuilder& compliance,
        std::size_t levels,
        bool encryptOutputs,
        beast::Journal journal);

    /**
     * @throws PoolError with code Unbalanced, FieldOverflow, MissingProof,
     *         RootMismatch, DuplicateNullifier, InvalidInput,
     *         MissingRecipientKey, NotRegistered or Sanctioned
     */
    WitnessResult
    build(WitnessRequest const& request);

private:
    InputSlot
    shapeInput(
        InputNote const& input,
        FieldT const& sk,
        FieldT const& pk,
        FieldT const& poolRoot) const;

    InputSlot
    dummyInput(
        FieldT const& sk,
        FieldT const& pk,
        std::size_t slot,
        FieldT const& nonce) const;

    FieldT
    rootFromPath(FieldT const& leaf, MerkleProof const& proof) const;

    Poseidon2 hasher_;
    ComplianceBuilder& compliance_;
    std::size_t levels_;
    bool encryptOutputs_;
    beast::Journal j_;
};

}  // namespace zkp
}  // namespace novapool
