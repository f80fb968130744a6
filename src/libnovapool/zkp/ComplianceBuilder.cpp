#include <libnovapool/zkp/ComplianceBuilder.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>

#include <utility>

namespace novapool {
namespace zkp {

namespace {

Json::Value
decimalArray(std::vector<FieldT> const& values)
{
    Json::Value array(Json::arrayValue);
    for (auto const& v : values)
        array.append(fieldToDecimal(v));
    return array;
}

}  // namespace

Json::Value
MembershipProofData::toJson() const
{
    Json::Value json(Json::objectValue);
    json["leaf"] = fieldToDecimal(leaf);
    json["blinding"] = fieldToDecimal(blinding);
    json["pathIndices"] = fieldToDecimal(fieldFromU64(pathIndices));
    json["pathElements"] = decimalArray(pathElements);
    json["root"] = fieldToDecimal(root);
    return json;
}

Json::Value
nonMembershipProofJson(NonMembershipProof const& proof)
{
    Json::Value json(Json::objectValue);
    json["key"] = fieldToDecimal(proof.key);
    json["oldKey"] = fieldToDecimal(proof.oldKey);
    json["oldValue"] = fieldToDecimal(proof.oldValue);
    json["isOld0"] = proof.isOld0 ? "1" : "0";
    json["siblings"] = decimalArray(proof.siblings);
    json["root"] = fieldToDecimal(proof.root);
    return json;
}

ComplianceBuilder::ComplianceBuilder(
    Poseidon2 hasher,
    AspMembershipStore const& membership,
    ChainGateway& gateway,
    std::size_t smtLevels,
    beast::Journal journal)
    : hasher_(std::move(hasher))
    , membership_(membership)
    , gateway_(gateway)
    , smtLevels_(smtLevels)
    , j_(journal)
{
}

FieldT
ComplianceBuilder::membershipLeaf(FieldT const& pk, FieldT const& blinding)
    const
{
    return hasher_.hash2(pk, blinding, domain::leaf);
}

MembershipProofData
ComplianceBuilder::membershipProof(
    FieldT const& pk,
    FieldT const& blinding,
    std::uint64_t leafIndex,
    FieldT const& expectedRoot) const
{
    auto const leaf = membershipLeaf(pk, blinding);
    auto const index = membership_.indexOf(leaf);
    if (!index)
        throw PoolError(
            ErrorCode::NotRegistered,
            "Public key is not registered in the ASP membership tree");
    if (*index != leafIndex)
        JLOG(j_.warn()) << "Membership leaf found at index " << *index
                        << " instead of " << leafIndex;

    auto const proof = membership_.proof(*index);
    if (proof.root != expectedRoot)
        JLOG(j_.warn()) << "Membership root mismatch: computed "
                        << fieldToHex(proof.root) << ", expected "
                        << fieldToHex(expectedRoot);

    MembershipProofData data;
    data.leaf = leaf;
    data.blinding = blinding;
    data.pathIndices = proof.pathIndices;
    data.pathElements = proof.pathElements;
    data.root = proof.root;
    return data;
}

NonMembershipProof
ComplianceBuilder::nonMembershipProof(
    FieldT const& pk,
    FieldT const& expectedRoot)
{
    if (expectedRoot == FieldT::zero())
    {
        JLOG(j_.debug()) << "Non-membership tree is empty, using empty proof";
        return SparseMerkleTree::emptyProof(pk, smtLevels_);
    }

    auto const state = callGateway("Reading non-membership state", [&] {
        return gateway_.readAspNonMembershipState();
    });
    if (state.root != expectedRoot)
        throw PoolError(
            ErrorCode::RootMismatch,
            "Non-membership root " + fieldToHex(expectedRoot) +
                " differs from the contract's " + fieldToHex(state.root));
    if (state.isEmpty)
        return SparseMerkleTree::emptyProof(pk, smtLevels_);

    auto const found = callGateway("Fetching non-membership proof", [&] {
        return gateway_.findNonMembershipKey(pk);
    });
    if (found.found)
        throw PoolError(
            ErrorCode::Sanctioned,
            "Key exists in non-membership tree (user is sanctioned)");
    if (found.siblings.size() > smtLevels_)
        throw PoolError(
            ErrorCode::RootMismatch,
            "Non-membership path is deeper than " +
                std::to_string(smtLevels_) + " levels");

    NonMembershipProof proof;
    proof.key = pk;
    proof.isOld0 = found.isOld0;
    proof.oldKey = found.isOld0 ? FieldT::zero() : found.notFoundKey;
    proof.oldValue = found.isOld0 ? FieldT::zero() : found.notFoundValue;
    proof.siblings = found.siblings;
    proof.siblings.resize(smtLevels_, FieldT::zero());
    proof.root = state.root;

    if (!SparseMerkleTree::verifyNonMembership(hasher_, proof))
        throw PoolError(
            ErrorCode::RootMismatch,
            "Non-membership proof does not hash to the contract's root");
    return proof;
}

}  // namespace zkp
}  // namespace novapool
