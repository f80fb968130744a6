#include <libnovapool/zkp/TransactionService.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>

#include <stdexcept>
#include <utility>

namespace novapool {
namespace zkp {

namespace {

std::string
requestAddress(Signer& signer)
{
    try
    {
        return signer.getAddress();
    }
    catch (PoolError const&)
    {
        throw;
    }
    catch (std::exception const& e)
    {
        throw walletError(e.what(), std::current_exception());
    }
}

Amount
totalOf(std::vector<StoredNote> const& notes)
{
    Amount total = 0;
    for (auto const& stored : notes)
        total += stored.note.amount;
    return total;
}

}  // namespace

TransactionService::TransactionService(
    PoolConfig const& config,
    Poseidon2 hasher,
    Signer& signer,
    ChainGateway& gateway,
    ProverClient& prover,
    NoteStore& notes,
    beast::Journal journal)
    : config_(config)
    , hasher_(std::move(hasher))
    , signer_(signer)
    , gateway_(gateway)
    , prover_(prover)
    , notes_(notes)
    , j_(journal)
    , pool_(hasher_, config_.levels, config_.rootHistorySize, journal)
    , membership_(hasher_, config_.membershipLevels, journal)
    , publicKeys_(journal)
    , compliance_(hasher_, membership_, gateway_, config_.smtLevels, journal)
    , builder_(
          hasher_,
          compliance_,
          config_.levels,
          config_.encryptOutputs,
          journal)
    , scanner_(hasher_, pool_, notes_, journal)
{
}

UserKeys const&
TransactionService::unlock()
{
    if (!keys_)
    {
        keys_ = deriveUserKeys(signer_, hasher_);
        JLOG(j_.info()) << "Keys unlocked for pk "
                        << fieldToHex(keys_->spending.pk);
    }
    return *keys_;
}

void
TransactionService::syncPool()
{
    auto const events = callGateway("Fetching pool events", [&] {
        return gateway_.getPoolEvents(config_.eventLimit);
    });
    pool_.processEvents(events);

    auto const state = callGateway(
        "Reading pool state", [&] { return gateway_.readPoolState(); });

    if (state.merkleLevels != 0 && state.merkleLevels != pool_.levels())
        JLOG(j_.warn()) << "Pool contract reports " << state.merkleLevels
                        << " levels, configured " << pool_.levels();

    if (pool_.root() == state.merkleRoot)
        return;

    JLOG(j_.warn()) << "Local pool root differs from the contract's, "
                       "rebuilding from "
                    << events.size() << " events";
    pool_.rebuild();
    if (pool_.root() == state.merkleRoot)
        return;

    pool_.clear();
    pool_.processEvents(events);
    if (pool_.root() != state.merkleRoot)
        throw PoolError(
            ErrorCode::RootMismatch,
            "Pool root " + fieldToHex(pool_.root()) +
                " does not match the contract's " +
                fieldToHex(state.merkleRoot) + " after rebuild");
}

void
TransactionService::syncMembership()
{
    auto const events = callGateway("Fetching membership events", [&] {
        return gateway_.getAspMembershipEvents(config_.eventLimit);
    });
    auto const count = membership_.processEvents(events);
    JLOG(j_.debug()) << "Processed " << count << " membership events, "
                     << membership_.nextIndex() << " leaves";
}

std::size_t
TransactionService::syncPublicKeys()
{
    auto const events = callGateway("Fetching public key events", [&] {
        return gateway_.getPublicKeyEvents(config_.eventLimit);
    });
    auto const count = publicKeys_.processEvents(events);
    JLOG(j_.debug()) << "Processed " << count << " public key events, "
                     << publicKeys_.size() << " addresses known";
    return count;
}

std::string
TransactionService::registerPublicKey()
{
    auto const& keys = unlock();
    auto const address = requestAddress(signer_);

    RegisterRequest request;
    request.owner = address;
    request.key =
        encodeAccountKey(keys.spending.pk, keys.encryption.publicKey);
    request.signerOptions.networkPassphrase = config_.networkPassphrase;
    request.signerOptions.address = address;

    auto const submitted = callGateway("Registering public key", [&] {
        return gateway_.registerPublicKey(request);
    });
    if (!submitted.success)
        throw PoolError(
            ErrorCode::ChainError,
            submitted.error.value_or("Registration was rejected"));

    JLOG(j_.info()) << "Registered public key for " << address;
    return submitted.txHash.value_or("");
}

NoteScanner::ScanResult
TransactionService::scanNotes()
{
    auto const& keys = unlock();
    syncPool();
    return scanner_.scan(keys);
}

void
TransactionService::requireAmount(Amount const& amount) const
{
    if (amount <= 0)
        throw std::invalid_argument("Amount must be positive");
    if (amount >= maxNoteAmount())
        throw PoolError(
            ErrorCode::FieldOverflow, "Amount must be below 2^248");
}

TransactionResult
TransactionService::deposit(
    Amount const& amount,
    std::vector<OutputRequest> outputs)
{
    requireAmount(amount);
    if (outputs.empty())
        outputs.push_back(OutputRequest{amount, {}, {}, {}});

    ExtData extData;
    extData.recipient = config_.poolContract;
    extData.extAmount = amount;
    extData.fee = Amount(0);

    JLOG(j_.info()) << "Depositing " << amount;
    return execute({}, std::move(outputs), std::move(extData));
}

TransactionResult
TransactionService::withdraw(
    std::vector<StoredNote> const& notes,
    Amount const& amount,
    std::string const& recipient)
{
    requireAmount(amount);
    auto const total = totalOf(notes);
    if (total < amount)
        throw PoolError(
            ErrorCode::Unbalanced,
            "Notes hold " + total.str() + ", cannot withdraw " +
                amount.str());

    std::vector<OutputRequest> outputs;
    outputs.push_back(OutputRequest{total - amount, {}, {}, {}});

    ExtData extData;
    extData.recipient = recipient;
    extData.extAmount = -amount;
    extData.fee = Amount(0);

    JLOG(j_.info()) << "Withdrawing " << amount << " to " << recipient;
    return execute(notes, std::move(outputs), std::move(extData));
}

TransactionResult
TransactionService::transfer(
    std::vector<StoredNote> const& notes,
    Amount const& amount,
    FieldT const& recipientPk,
    X25519Key const& recipientEncryptionPk)
{
    requireAmount(amount);
    auto const total = totalOf(notes);
    if (total < amount)
        throw PoolError(
            ErrorCode::Unbalanced,
            "Notes hold " + total.str() + ", cannot transfer " +
                amount.str());

    std::vector<OutputRequest> outputs;
    outputs.push_back(
        OutputRequest{amount, {}, recipientPk, recipientEncryptionPk});
    outputs.push_back(OutputRequest{total - amount, {}, {}, {}});

    ExtData extData;
    extData.recipient = config_.poolContract;
    extData.extAmount = 0;
    extData.fee = Amount(0);

    JLOG(j_.info()) << "Transferring " << amount << " to pk "
                    << fieldToHex(recipientPk);
    return execute(notes, std::move(outputs), std::move(extData));
}

TransactionResult
TransactionService::transfer(
    std::vector<StoredNote> const& notes,
    Amount const& amount,
    std::string const& recipientAddress)
{
    auto record = publicKeys_.getByAddress(recipientAddress);
    if (!record)
    {
        syncPublicKeys();
        record = publicKeys_.getByAddress(recipientAddress);
    }
    if (!record)
        throw PoolError(
            ErrorCode::MissingRecipientKey,
            "No public key registered for " + recipientAddress);

    JLOG(j_.debug()) << "Resolved " << recipientAddress << " from ledger "
                     << record->ledger;
    return transfer(notes, amount, record->noteKey, record->encryptionKey);
}

std::vector<InputNote>
TransactionService::prepareInputs(std::vector<StoredNote> const& notes) const
{
    std::vector<InputNote> inputs;
    inputs.reserve(notes.size());
    for (auto const& stored : notes)
    {
        if (stored.spent || pool_.isNullifierSpent(stored.nullifier))
            throw PoolError(
                ErrorCode::DuplicateNullifier,
                "Note at leaf " + std::to_string(stored.leafIndex) +
                    " is already spent");

        auto const index = pool_.indexOf(stored.commitment);
        if (!index || *index != stored.leafIndex)
            throw PoolError(
                ErrorCode::MissingProof,
                "Note commitment is not in the pool tree at leaf " +
                    std::to_string(stored.leafIndex));

        inputs.push_back(InputNote{stored.note, pool_.proof(stored.leafIndex)});
    }
    return inputs;
}

TransactionResult
TransactionService::execute(
    std::vector<StoredNote> const& notes,
    std::vector<OutputRequest> outputs,
    ExtData extData)
{
    auto const& keys = unlock();

    syncPool();
    syncMembership();

    auto const aspMembership = callGateway("Reading ASP membership", [&] {
        return gateway_.readAspMembershipState();
    });
    auto const aspNonMembership =
        callGateway("Reading ASP non-membership", [&] {
            return gateway_.readAspNonMembershipState();
        });

    WitnessRequest request;
    request.sk = keys.spending.sk;
    request.encryptionPk = keys.encryption.publicKey;
    request.poolRoot = pool_.root();
    request.membershipRoot = aspMembership.root;
    request.nonMembershipRoot =
        aspNonMembership.isEmpty ? FieldT::zero() : aspNonMembership.root;
    request.inputs = prepareInputs(notes);
    request.outputs = std::move(outputs);
    request.extData = std::move(extData);
    request.membershipLeafIndex = registration_.leafIndex;
    request.membershipBlinding = registration_.blinding;
    request.dummyNonce = randomBlinding();

    TransactionResult result;
    result.witness = builder_.build(request);

    result.proof = prover_.prove(
        result.witness.circuitInputs, [this](DownloadProgress const& p) {
            JLOG(j_.debug()) << "Prover: " << p.message;
        });
    if (!prover_.verify(result.proof.compressed, result.proof.publicInputs))
        throw PoolError(
            ErrorCode::ProverFailure, "Proof failed local verification");

    auto& onChain = result.onChain;
    onChain.proof = result.proof.onChain;
    onChain.root = request.poolRoot;
    for (std::size_t i = 0; i < N_INS; ++i)
        onChain.inputNullifiers[i] = result.witness.inputs[i].nullifier;
    onChain.outputCommitment0 = result.witness.outputs[0].commitment;
    onChain.outputCommitment1 = result.witness.outputs[1].commitment;
    onChain.publicAmount = result.witness.publicAmount;
    onChain.extDataHash = result.witness.extDataHash.bytesBE;
    onChain.aspMembershipRoot = result.witness.membership.root;
    onChain.aspNonMembershipRoot = result.witness.nonMembership.root;

    auto const address = requestAddress(signer_);
    SubmitRequest submit;
    submit.proof = onChain;
    submit.extData = result.witness.extData;
    submit.sender = address;
    submit.signerOptions.networkPassphrase = config_.networkPassphrase;
    submit.signerOptions.address = address;

    auto const submitted = callGateway("Submitting transaction", [&] {
        return gateway_.submitPoolTransaction(submit);
    });
    if (!submitted.success)
        throw PoolError(
            ErrorCode::ChainError,
            submitted.error.value_or("Transaction was rejected"));

    result.txHash = submitted.txHash.value_or("");
    result.ledger = submitted.ledger;
    JLOG(j_.info()) << "Transaction " << result.txHash << " accepted";

    auto const ledger = submitted.ledger.value_or(0);
    for (auto const& stored : notes)
        notes_.markSpent(stored.commitment, ledger);

    result.storedOutputs = persistOutputs(result.witness, ledger);
    return result;
}

std::vector<StoredNote>
TransactionService::persistOutputs(
    WitnessResult const& witness,
    std::uint32_t ledger)
{
    try
    {
        syncPool();
    }
    catch (PoolError const& e)
    {
        // The transaction is final; a later scanNotes() picks the outputs up
        JLOG(j_.warn()) << "Could not resync after submission: " << e.what();
        return {};
    }

    std::vector<StoredNote> stored;
    for (auto const& output : witness.outputs)
    {
        if (!output.toSelf || output.note.isDummy())
            continue;

        auto const index = pool_.indexOf(output.commitment);
        if (!index)
        {
            JLOG(j_.warn()) << "Output " << fieldToHex(output.commitment)
                            << " not found in the pool tree";
            continue;
        }

        StoredNote note;
        note.note = output.note;
        note.commitment = output.commitment;
        note.leafIndex = *index;
        note.nullifier =
            spendNullifier(hasher_, output.note, keys_->spending.sk, *index);
        note.createdAtLedger = ledger;
        notes_.put(note);
        stored.push_back(note);
    }
    return stored;
}

}  // namespace zkp
}  // namespace novapool
