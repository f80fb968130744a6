#include <test/support/FakeChainGateway.h>

#include <libnovapool/zkp/ExtData.h>
#include <libnovapool/zkp/ZKProver.h>

#include <algorithm>
#include <stdexcept>

namespace novapool {
namespace test {

using namespace zkp;

FakeChainGateway::FakeChainGateway(
    Poseidon2 const& hasher,
    std::size_t levels,
    std::size_t membershipLevels)
    : hasher_(hasher)
    , poolTree_(hasher, levels, zeroLeaf(), 100)
    , membershipTree_(hasher, membershipLevels)
    , sanctions_(hasher)
{
}

void
FakeChainGateway::checkOnline() const
{
    if (offline)
        throw std::runtime_error("RPC request failed: connection refused");
}

PoolState
FakeChainGateway::readPoolState()
{
    checkOnline();
    PoolState state;
    state.merkleRoot = reportedRoot.value_or(poolTree_.root());
    state.merkleNextIndex = poolTree_.size();
    state.merkleLevels = static_cast<std::uint32_t>(poolTree_.depth());
    return state;
}

AspMembershipState
FakeChainGateway::readAspMembershipState()
{
    checkOnline();
    return {membershipTree_.root(), membershipTree_.size(), membershipTree_.capacity()};
}

AspNonMembershipState
FakeChainGateway::readAspNonMembershipState()
{
    checkOnline();
    return {sanctions_.root(), sanctions_.empty()};
}

std::vector<PoolEvent>
FakeChainGateway::getPoolEvents(std::size_t limit)
{
    checkOnline();
    auto const n = std::min(limit, poolEvents_.size());
    return std::vector<PoolEvent>(poolEvents_.begin(), poolEvents_.begin() + n);
}

std::vector<LeafAddedEvent>
FakeChainGateway::getAspMembershipEvents(std::size_t limit)
{
    checkOnline();
    auto const n = std::min(limit, membershipEvents_.size());
    return std::vector<LeafAddedEvent>(
        membershipEvents_.begin(), membershipEvents_.begin() + n);
}

std::vector<PublicKeyEvent>
FakeChainGateway::getPublicKeyEvents(std::size_t limit)
{
    checkOnline();
    auto const n = std::min(limit, publicKeyEvents_.size());
    return std::vector<PublicKeyEvent>(
        publicKeyEvents_.begin(), publicKeyEvents_.begin() + n);
}

SmtFindResult
FakeChainGateway::findNonMembershipKey(FieldT const& key)
{
    checkOnline();
    ++findCalls;
    return sanctions_.find(key);
}

SubmitResult
FakeChainGateway::reject(std::string const& error)
{
    SubmitResult result;
    result.success = false;
    result.error = "HostError: " + error;
    return result;
}

bool
FakeChainGateway::isSpent(FieldT const& nullifier) const
{
    return nullifiers_.count(fieldToUint256(nullifier)) != 0;
}

SubmitResult
FakeChainGateway::submitPoolTransaction(SubmitRequest const& request)
{
    checkOnline();
    submitted.push_back(request);

    if (rejectNext)
    {
        auto const error = *rejectNext;
        rejectNext.reset();
        return reject(error);
    }

    auto const& proof = request.proof;
    if (proof.proof.size() != ONCHAIN_PROOF_SIZE)
        return reject("Error(Contract, #7)");
    if (!poolTree_.isKnownRoot(proof.root))
        return reject("Error(Contract, #8)");

    for (std::size_t i = 0; i < proof.inputNullifiers.size(); ++i)
    {
        auto const& n = proof.inputNullifiers[i];
        if (isSpent(n))
            return reject("Error(Contract, #9)");
        for (std::size_t j = 0; j < i; ++j)
        {
            if (proof.inputNullifiers[j] == n)
                return reject("Error(Contract, #9)");
        }
    }

    if (hashExtData(request.extData).bytesBE != proof.extDataHash)
        return reject("Error(Contract, #7)");
    auto const fee = request.extData.fee.value_or(0);
    if (calculatePublicAmount(request.extData.extAmount, fee) !=
        proof.publicAmount)
        return reject("Error(Contract, #7)");
    if (proof.aspMembershipRoot != membershipTree_.root() ||
        proof.aspNonMembershipRoot != sanctions_.root())
        return reject("Error(Contract, #8)");

    ++ledger_;
    auto const txHash = "tx" + std::to_string(ledger_);

    for (auto const& n : proof.inputNullifiers)
    {
        nullifiers_[fieldToUint256(n)] = true;
        PoolEvent event;
        event.kind = PoolEvent::Kind::NewNullifier;
        event.nullifier = n;
        event.ledger = ledger_;
        event.txHash = txHash;
        event.id = std::to_string(poolEvents_.size());
        poolEvents_.push_back(event);
    }

    auto emit = [&](FieldT const& commitment, ripple::Blob const& enc) {
        PoolEvent event;
        event.kind = PoolEvent::Kind::NewCommitment;
        event.commitment = commitment;
        event.index = poolTree_.insert(commitment);
        event.encryptedOutput = enc;
        event.ledger = ledger_;
        event.txHash = txHash;
        event.id = std::to_string(poolEvents_.size());
        poolEvents_.push_back(event);
    };
    emit(proof.outputCommitment0, request.extData.encryptedOutput0);
    emit(proof.outputCommitment1, request.extData.encryptedOutput1);

    SubmitResult result;
    result.success = true;
    result.txHash = txHash;
    result.ledger = ledger_;
    return result;
}

SubmitResult
FakeChainGateway::registerPublicKey(RegisterRequest const& request)
{
    checkOnline();
    registered.push_back(request);

    if (rejectNext)
    {
        auto const error = *rejectNext;
        rejectNext.reset();
        return reject(error);
    }
    if (request.owner.empty() || request.signerOptions.address != request.owner)
        return reject("Error(Auth, InvalidAction)");

    PublicKeyEvent event;
    event.owner = request.owner;
    event.key = request.key;
    event.ledger = ++ledger_;
    publicKeyEvents_.push_back(event);

    SubmitResult result;
    result.success = true;
    result.txHash = "tx" + std::to_string(ledger_);
    result.ledger = ledger_;
    return result;
}

std::uint64_t
FakeChainGateway::addMember(FieldT const& leaf)
{
    LeafAddedEvent event;
    event.leaf = leaf;
    event.index = membershipTree_.insert(leaf);
    event.root = membershipTree_.root();
    event.ledger = ++ledger_;
    membershipEvents_.push_back(event);
    return event.index;
}

void
FakeChainGateway::sanction(FieldT const& pk)
{
    sanctions_.insert(pk, pk);
}

std::uint64_t
FakeChainGateway::appendCommitment(
    FieldT const& commitment,
    ripple::Blob encryptedOutput)
{
    PoolEvent event;
    event.kind = PoolEvent::Kind::NewCommitment;
    event.commitment = commitment;
    event.index = poolTree_.insert(commitment);
    event.encryptedOutput = std::move(encryptedOutput);
    event.ledger = ++ledger_;
    event.id = std::to_string(poolEvents_.size());
    poolEvents_.push_back(event);
    return event.index;
}

}  // namespace test
}  // namespace novapool
