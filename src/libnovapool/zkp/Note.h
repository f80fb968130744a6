#pragma once

#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/Poseidon2.h>
#include <xrpl/json/json_value.h>
#include <cstdint>
#include <utility>

namespace novapool {
namespace zkp {

/**
 * Shielded note
 *
 * A note contains:
 * - amount: value carried by the note, in [0, 2^248)
 * - pk: owner public key, Poseidon2(sk, 0, keypair)
 * - blinding: random field element hiding the commitment
 *
 * A note with amount 0 is a dummy: it fills an input or output slot
 * without touching the pool tree.
 */
struct Note
{
    Amount amount;
    FieldT pk;
    FieldT blinding;

    Note() = default;

    Note(Amount a, FieldT const& owner, FieldT const& blind)
        : amount(std::move(a)), pk(owner), blinding(blind)
    {
    }

    /** Poseidon2(amount, pk, blinding, commitment) */
    FieldT
    commitment(Poseidon2 const& hasher) const;

    bool
    isDummy() const
    {
        return amount == 0;
    }

    Json::Value
    toJson() const;

    static Note
    fromJson(Json::Value const& json);
};

/**
 * Spend authorization: Poseidon2(sk, commitment, pathIndices, signature).
 * Only meaningful when Poseidon2(sk, 0, keypair) equals the note's pk.
 */
FieldT
noteSignature(
    Poseidon2 const& hasher,
    FieldT const& sk,
    FieldT const& commitment,
    FieldT const& pathIndices);

/** Poseidon2(commitment, pathIndices, signature, nullifier) */
FieldT
noteNullifier(
    Poseidon2 const& hasher,
    FieldT const& commitment,
    FieldT const& pathIndices,
    FieldT const& signature);

/** Convenience: nullifier of a note owned by sk at leaf pathIndices. */
FieldT
spendNullifier(
    Poseidon2 const& hasher,
    Note const& note,
    FieldT const& sk,
    std::uint64_t pathIndices);

/** Blinding of the dummy input in a given slot (101, 202, ...). */
FieldT
dummyInputBlinding(std::size_t slot);

/**
 * Zero-amount input note owned by pk for the given slot. The pool
 * records every input nullifier, dummies included, so callers that
 * transact more than once pass a fresh nonce to offset the blinding.
 */
Note
dummyInputNote(
    FieldT const& pk,
    std::size_t slot,
    FieldT const& nonce = FieldT::zero());

}  // namespace zkp
}  // namespace novapool
