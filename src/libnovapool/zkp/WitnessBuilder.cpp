#include <libnovapool/zkp/WitnessBuilder.h>
#include <libnovapool/zkp/NoteEncryption.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>

#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace novapool {
namespace zkp {

namespace {

void
checkNoteAmount(Amount const& amount, char const* what)
{
    if (amount < 0 || amount >= maxNoteAmount())
        throw PoolError(
            ErrorCode::FieldOverflow,
            std::string(what) + " amount " + amount.str() +
                " is outside [0, 2^248)");
}

std::uint64_t
sealableAmount(Amount const& amount)
{
    if (amount > std::numeric_limits<std::uint64_t>::max())
        throw PoolError(
            ErrorCode::FieldOverflow,
            "Output amount " + amount.str() + " cannot be sealed in a note");
    return amount.convert_to<std::uint64_t>();
}

Json::Value
decimal(FieldT const& x)
{
    return fieldToDecimal(x);
}

Json::Value
decimalArray(std::vector<FieldT> const& values)
{
    Json::Value array(Json::arrayValue);
    for (auto const& v : values)
        array.append(fieldToDecimal(v));
    return array;
}

Json::Value
singleton(Json::Value const& value)
{
    Json::Value array(Json::arrayValue);
    array.append(value);
    return array;
}

}  // namespace

WitnessBuilder::WitnessBuilder(
    Poseidon2 hasher,
    ComplianceBuilder& compliance,
    std::size_t levels,
    bool encryptOutputs,
    beast::Journal journal)
    : hasher_(std::move(hasher))
    , compliance_(compliance)
    , levels_(levels)
    , encryptOutputs_(encryptOutputs)
    , j_(journal)
{
}

FieldT
WitnessBuilder::rootFromPath(FieldT const& leaf, MerkleProof const& proof) const
{
    FieldT current = leaf;
    for (std::size_t level = 0; level < proof.pathElements.size(); ++level)
    {
        auto const& sibling = proof.pathElements[level];
        if ((proof.pathIndices >> level) & 1)
            current = hasher_.compress(sibling, current);
        else
            current = hasher_.compress(current, sibling);
    }
    return current;
}

InputSlot
WitnessBuilder::dummyInput(
    FieldT const& sk,
    FieldT const& pk,
    std::size_t slot,
    FieldT const& nonce) const
{
    InputSlot input;
    input.note = dummyInputNote(pk, slot, nonce);
    input.commitment = input.note.commitment(hasher_);
    input.nullifier = spendNullifier(hasher_, input.note, sk, 0);
    input.pathIndices = 0;
    input.pathElements.assign(levels_, FieldT::zero());
    input.dummy = true;
    return input;
}

InputSlot
WitnessBuilder::shapeInput(
    InputNote const& in,
    FieldT const& sk,
    FieldT const& pk,
    FieldT const& poolRoot) const
{
    checkNoteAmount(in.note.amount, "Input");
    if (in.note.pk != pk)
        throw PoolError(
            ErrorCode::InvalidInput,
            "Input note is not owned by the spending key");

    InputSlot input;
    input.note = in.note;
    input.commitment = in.note.commitment(hasher_);
    input.dummy = in.note.isDummy();

    if (input.dummy)
    {
        input.pathIndices = 0;
        input.pathElements.assign(levels_, FieldT::zero());
    }
    else
    {
        if (!in.merkleProof || in.merkleProof->pathElements.size() != levels_)
            throw PoolError(
                ErrorCode::MissingProof,
                "Input note lacks a Merkle proof of depth " +
                    std::to_string(levels_));

        auto const& proof = *in.merkleProof;
        if (rootFromPath(input.commitment, proof) != poolRoot)
            throw PoolError(
                ErrorCode::RootMismatch,
                "Input note's Merkle path does not lead to the pool root");
        input.pathIndices = proof.pathIndices;
        input.pathElements = proof.pathElements;
    }

    input.nullifier = spendNullifier(hasher_, in.note, sk, input.pathIndices);
    return input;
}

WitnessResult
WitnessBuilder::build(WitnessRequest const& request)
{
    if (request.inputs.size() > N_INS)
        throw std::invalid_argument(
            "At most " + std::to_string(N_INS) + " inputs are supported");
    if (request.outputs.size() > N_OUTS)
        throw std::invalid_argument(
            "At most " + std::to_string(N_OUTS) + " outputs are supported");

    WitnessResult result;
    auto const pk = derivePublicKey(hasher_, request.sk);

    // Inputs, padded with dummies
    Amount inTotal = 0;
    for (std::size_t slot = 0; slot < N_INS; ++slot)
    {
        if (slot < request.inputs.size())
            result.inputs[slot] = shapeInput(
                request.inputs[slot], request.sk, pk, request.poolRoot);
        else
            result.inputs[slot] = dummyInput(request.sk, pk, slot, request.dummyNonce);
        inTotal += result.inputs[slot].note.amount;
    }

    std::set<ripple::uint256> nullifiers;
    for (auto const& input : result.inputs)
    {
        if (!nullifiers.insert(fieldToUint256(input.nullifier)).second)
            throw PoolError(
                ErrorCode::DuplicateNullifier,
                "Two inputs share nullifier " + fieldToHex(input.nullifier));
    }

    // Outputs, padded with zero-amount notes to self
    Amount outTotal = 0;
    for (std::size_t slot = 0; slot < N_OUTS; ++slot)
    {
        OutputRequest const padding{0, std::nullopt, std::nullopt, std::nullopt};
        auto const& out =
            slot < request.outputs.size() ? request.outputs[slot] : padding;
        checkNoteAmount(out.amount, "Output");

        auto& output = result.outputs[slot];
        output.note = Note(
            out.amount,
            out.recipientPk.value_or(pk),
            out.blinding ? *out.blinding : randomBlinding());
        output.commitment = output.note.commitment(hasher_);
        output.toSelf = output.note.pk == pk;
        if (out.recipientEncryptionPk)
            output.encryptionPk = *out.recipientEncryptionPk;
        else if (output.toSelf)
            output.encryptionPk = request.encryptionPk;
        else if (encryptOutputs_)
            throw PoolError(
                ErrorCode::MissingRecipientKey,
                "Output " + std::to_string(slot) +
                    " goes to another key but has no encryption key");
        outTotal += out.amount;
    }

    auto const fee = request.extData.fee.value_or(0);
    result.publicAmount = calculatePublicAmount(request.extData.extAmount, fee);
    if (inTotal + request.extData.extAmount - fee != outTotal)
        throw PoolError(
            ErrorCode::Unbalanced,
            "Inputs " + inTotal.str() + " plus public amount " +
                Amount(request.extData.extAmount - fee).str() +
                " do not equal outputs " + outTotal.str());

    // Compliance
    result.membership = compliance_.membershipProof(
        pk,
        request.membershipBlinding,
        request.membershipLeafIndex,
        request.membershipRoot);
    result.nonMembership =
        compliance_.nonMembershipProof(pk, request.nonMembershipRoot);

    // Ext-data
    result.extData = request.extData;
    if (encryptOutputs_)
    {
        std::array<ripple::Blob, N_OUTS> sealed;
        for (std::size_t slot = 0; slot < N_OUTS; ++slot)
        {
            auto const& output = result.outputs[slot];
            sealed[slot] = encryptNote(
                output.encryptionPk,
                NotePlaintext{
                    sealableAmount(output.note.amount),
                    output.note.blinding});
        }
        result.extData.encryptedOutput0 = std::move(sealed[0]);
        result.extData.encryptedOutput1 = std::move(sealed[1]);
    }
    else
    {
        result.extData.encryptedOutput0.clear();
        result.extData.encryptedOutput1.clear();
    }
    result.extDataHash = hashExtData(result.extData);

    // Circuit input
    Json::Value& w = result.circuitInputs = Json::Value(Json::objectValue);
    w["root"] = decimal(request.poolRoot);
    w["publicAmount"] = decimal(result.publicAmount);
    w["extDataHash"] = decimal(result.extDataHash.field);

    Json::Value& inputNullifier = w["inputNullifier"] = Json::Value(Json::arrayValue);
    Json::Value& inAmount = w["inAmount"] = Json::Value(Json::arrayValue);
    Json::Value& inPrivateKey = w["inPrivateKey"] = Json::Value(Json::arrayValue);
    Json::Value& inBlinding = w["inBlinding"] = Json::Value(Json::arrayValue);
    Json::Value& inPathIndices = w["inPathIndices"] = Json::Value(Json::arrayValue);
    Json::Value& inPathElements = w["inPathElements"] = Json::Value(Json::arrayValue);
    Json::Value& membershipRoots = w["membershipRoots"] = Json::Value(Json::arrayValue);
    Json::Value& nonMembershipRoots = w["nonMembershipRoots"] = Json::Value(Json::arrayValue);
    Json::Value& membershipProofs = w["membershipProofs"] = Json::Value(Json::arrayValue);
    Json::Value& nonMembershipProofs = w["nonMembershipProofs"] = Json::Value(Json::arrayValue);

    auto const membershipJson = result.membership.toJson();
    auto const nonMembershipJson = nonMembershipProofJson(result.nonMembership);
    for (auto const& input : result.inputs)
    {
        inputNullifier.append(decimal(input.nullifier));
        inAmount.append(input.note.amount.str());
        inPrivateKey.append(decimal(request.sk));
        inBlinding.append(decimal(input.note.blinding));
        inPathIndices.append(decimal(fieldFromU64(input.pathIndices)));
        inPathElements.append(decimalArray(input.pathElements));
        membershipRoots.append(singleton(decimal(result.membership.root)));
        nonMembershipRoots.append(
            singleton(decimal(result.nonMembership.root)));
        membershipProofs.append(singleton(membershipJson));
        nonMembershipProofs.append(singleton(nonMembershipJson));
    }

    Json::Value& outputCommitment = w["outputCommitment"] = Json::Value(Json::arrayValue);
    Json::Value& outAmount = w["outAmount"] = Json::Value(Json::arrayValue);
    Json::Value& outPubkey = w["outPubkey"] = Json::Value(Json::arrayValue);
    Json::Value& outBlinding = w["outBlinding"] = Json::Value(Json::arrayValue);
    for (auto const& output : result.outputs)
    {
        outputCommitment.append(decimal(output.commitment));
        outAmount.append(output.note.amount.str());
        outPubkey.append(decimal(output.note.pk));
        outBlinding.append(decimal(output.note.blinding));
    }

    JLOG(j_.debug()) << "Built witness: " << request.inputs.size()
                     << " real inputs, public amount "
                     << Amount(request.extData.extAmount - fee).str();
    return result;
}

}  // namespace zkp
}  // namespace novapool
