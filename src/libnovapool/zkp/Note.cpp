#include <libnovapool/zkp/Note.h>
#include <libnovapool/zkp/PoolError.h>

#include <stdexcept>

namespace novapool {
namespace zkp {

FieldT
Note::commitment(Poseidon2 const& hasher) const
{
    if (amount < 0)
        throw std::invalid_argument("Note amount must not be negative");
    return hasher.hash3(
        fieldFromAmount(amount), pk, blinding, domain::commitment);
}

Json::Value
Note::toJson() const
{
    Json::Value json(Json::objectValue);
    json["amount"] = amount.str();
    json["pk"] = fieldToHex(pk);
    json["blinding"] = fieldToHex(blinding);
    return json;
}

Note
Note::fromJson(Json::Value const& json)
{
    if (!json.isObject() || !json.isMember("amount") ||
        !json.isMember("pk") || !json.isMember("blinding"))
        throw std::invalid_argument("Note JSON requires amount, pk, blinding");

    auto const amount = json["amount"].asString();
    Note note;
    note.amount = amountFromField(fieldFromDecimal(amount));
    note.pk = fieldFromHex(json["pk"].asString());
    note.blinding = fieldFromHex(json["blinding"].asString());
    return note;
}

FieldT
noteSignature(
    Poseidon2 const& hasher,
    FieldT const& sk,
    FieldT const& commitment,
    FieldT const& pathIndices)
{
    return hasher.hash3(sk, commitment, pathIndices, domain::signature);
}

FieldT
noteNullifier(
    Poseidon2 const& hasher,
    FieldT const& commitment,
    FieldT const& pathIndices,
    FieldT const& signature)
{
    return hasher.hash3(commitment, pathIndices, signature, domain::nullifier);
}

FieldT
spendNullifier(
    Poseidon2 const& hasher,
    Note const& note,
    FieldT const& sk,
    std::uint64_t pathIndices)
{
    auto const cm = note.commitment(hasher);
    auto const indices = fieldFromU64(pathIndices);
    auto const sig = noteSignature(hasher, sk, cm, indices);
    return noteNullifier(hasher, cm, indices, sig);
}

FieldT
dummyInputBlinding(std::size_t slot)
{
    return fieldFromU64(101 * (slot + 1));
}

Note
dummyInputNote(FieldT const& pk, std::size_t slot, FieldT const& nonce)
{
    return Note(0, pk, dummyInputBlinding(slot) + nonce);
}

}  // namespace zkp
}  // namespace novapool
