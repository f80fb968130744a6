#pragma once

#include <libnovapool/zkp/Field.h>
#include <xrpl/basics/Blob.h>
#include <array>
#include <optional>
#include <string>

namespace novapool {
namespace zkp {

/**
 * Transaction metadata bound to a proof through extDataHash.
 *
 * extAmount is positive for deposits and negative for withdrawals. The
 * encrypted outputs are filled in by the witness builder.
 */
struct ExtData
{
    std::string recipient;
    Amount extAmount = 0;
    std::optional<Amount> fee;
    ripple::Blob encryptedOutput0;
    ripple::Blob encryptedOutput1;
};

struct ExtDataHash
{
    // Keccak-256 of the XDR map, reduced mod BN254_FR
    FieldT field;
    // Same value, 32 bytes big-endian, as passed to the pool contract
    FieldBytes bytesBE;
};

enum class AddressType {
    Account,   // G...
    Contract,  // C...
};

struct StrKey
{
    AddressType type;
    std::array<std::uint8_t, 32> payload;
};

/** Decode a Stellar G... or C... address. Throws InvalidAddress. */
StrKey
decodeStrKey(std::string const& address);

std::string
encodeStrKey(StrKey const& key);

/**
 * Canonical ScVal::Map XDR of the ext-data, entries ordered by symbol:
 * encrypted_output0, encrypted_output1, ext_amount, [fee], recipient.
 */
ripple::Blob
serializeExtData(ExtData const& extData);

ExtDataHash
hashExtData(ExtData const& extData);

/**
 * extAmount - fee mapped into the field, as computed by the pool
 * contract. Throws FieldOverflow unless 0 <= fee < 2^248 and
 * |extAmount| < 2^248.
 */
FieldT
calculatePublicAmount(Amount const& extAmount, Amount const& fee);

}  // namespace zkp
}  // namespace novapool
