#pragma once

#include <libnovapool/zkp/Config.h>
#include <libnovapool/zkp/ExtData.h>
#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/PoolError.h>
#include <libnovapool/zkp/Signer.h>
#include <libnovapool/zkp/SparseMerkleTree.h>
#include <xrpl/basics/Blob.h>
#include <array>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace novapool {
namespace zkp {

struct PoolState
{
    FieldT merkleRoot;
    std::uint64_t merkleNextIndex = 0;
    std::uint32_t merkleLevels = 0;
};

struct AspMembershipState
{
    FieldT root;
    std::uint64_t nextIndex = 0;
    std::uint64_t capacity = 0;
};

struct AspNonMembershipState
{
    FieldT root;
    bool isEmpty = true;
};

/** Event emitted by the pool contract. */
struct PoolEvent
{
    enum class Kind { NewCommitment, NewNullifier };

    Kind kind = Kind::NewCommitment;
    // NewCommitment
    FieldT commitment;
    std::uint64_t index = 0;
    ripple::Blob encryptedOutput;
    // NewNullifier
    FieldT nullifier;

    std::string id;
    std::uint32_t ledger = 0;
    std::string txHash;
};

/** LeafAdded event of the ASP membership contract. */
struct LeafAddedEvent
{
    FieldT leaf;
    std::uint64_t index = 0;
    FieldT root;
    std::uint32_t ledger = 0;
};

/**
 * PublicKeyEvent of the pool contract, emitted by register. The key is
 * the owner's note public key (32 bytes, big-endian) followed by their
 * X25519 encryption key.
 */
struct PublicKeyEvent
{
    std::string owner;
    ripple::Blob key;
    std::uint32_t ledger = 0;
};

/** Arguments of the pool contract's register call. */
struct RegisterRequest
{
    std::string owner;
    ripple::Blob key;
    SignOptions signerOptions;
};

/** Arguments of the pool contract's transact call. */
struct OnChainProof
{
    // a (64) || b (128) || c (64)
    ripple::Blob proof;
    FieldT root;
    std::array<FieldT, N_INS> inputNullifiers;
    FieldT outputCommitment0;
    FieldT outputCommitment1;
    FieldT publicAmount;
    FieldBytes extDataHash{};
    FieldT aspMembershipRoot;
    FieldT aspNonMembershipRoot;
};

struct SubmitRequest
{
    OnChainProof proof;
    ExtData extData;
    std::string sender;
    SignOptions signerOptions;
};

struct SubmitResult
{
    bool success = false;
    std::optional<std::string> txHash;
    std::optional<std::uint32_t> ledger;
    std::optional<std::string> error;
};

/**
 * Read and submit access to the pool and ASP contracts.
 *
 * Transport failures are thrown; contract rejections of a submitted
 * transaction come back as SubmitResult::error.
 */
class ChainGateway
{
public:
    virtual ~ChainGateway() = default;

    virtual PoolState
    readPoolState() = 0;

    virtual AspMembershipState
    readAspMembershipState() = 0;

    virtual AspNonMembershipState
    readAspNonMembershipState() = 0;

    /** Pool events in emission order, at most limit of them. */
    virtual std::vector<PoolEvent>
    getPoolEvents(std::size_t limit) = 0;

    virtual std::vector<LeafAddedEvent>
    getAspMembershipEvents(std::size_t limit) = 0;

    /** Registrations in emission order, at most limit of them. */
    virtual std::vector<PublicKeyEvent>
    getPublicKeyEvents(std::size_t limit) = 0;

    /** The non-membership contract's find_key view, unpadded. */
    virtual SmtFindResult
    findNonMembershipKey(FieldT const& key) = 0;

    virtual SubmitResult
    submitPoolTransaction(SubmitRequest const& request) = 0;

    virtual SubmitResult
    registerPublicKey(RegisterRequest const& request) = 0;
};

/**
 * Run a gateway call, reporting transport failures as NetworkError with
 * the original exception as cause.
 */
template <class F>
auto
callGateway(char const* what, F&& f) -> decltype(f())
{
    try
    {
        return f();
    }
    catch (PoolError const&)
    {
        throw;
    }
    catch (std::exception const& e)
    {
        throw PoolError(
            ErrorCode::NetworkError,
            std::string(what) + ": " + e.what(),
            std::current_exception());
    }
}

}  // namespace zkp
}  // namespace novapool
