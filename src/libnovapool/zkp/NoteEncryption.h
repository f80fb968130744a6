#pragma once

#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/KeyDerivation.h>
#include <xrpl/basics/Blob.h>
#include <optional>

namespace novapool {
namespace zkp {

/** Sealed note length: ephemeral pk (32) + nonce (24) + tag (16) + body (40). */
constexpr std::size_t ENC_LEN = 112;

constexpr std::size_t NOTE_PLAINTEXT_SIZE = 40;

struct NotePlaintext
{
    std::uint64_t amount;
    FieldT blinding;
};

/**
 * Seal amount and blinding for the holder of recipientPk using
 * X25519 + XSalsa20-Poly1305 with a fresh ephemeral key and nonce.
 */
ripple::Blob
encryptNote(X25519Key const& recipientPk, NotePlaintext const& note);

/**
 * Try to open a sealed note. Returns nothing when the note was sealed
 * for a different key or the body is not a note.
 *
 * @throws PoolError(InvalidCiphertext) if the input is shorter than ENC_LEN.
 */
std::optional<NotePlaintext>
decryptNote(X25519Key const& secretKey, ripple::Blob const& ciphertext);

}  // namespace zkp
}  // namespace novapool
