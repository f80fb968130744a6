#include <libnovapool/zkp/NoteEncryption.h>
#include <libnovapool/zkp/PoolError.h>

#include <sodium.h>

#include <algorithm>
#include <stdexcept>

namespace novapool {
namespace zkp {

static_assert(crypto_scalarmult_BYTES == 32, "X25519 keys are 32 bytes");
static_assert(crypto_secretbox_KEYBYTES == crypto_scalarmult_BYTES, "");
static_assert(
    crypto_scalarmult_BYTES + crypto_secretbox_NONCEBYTES +
            crypto_secretbox_MACBYTES + NOTE_PLAINTEXT_SIZE ==
        ENC_LEN,
    "sealed note layout");

namespace {

constexpr std::size_t nonceOffset = crypto_scalarmult_BYTES;
constexpr std::size_t boxOffset = nonceOffset + crypto_secretbox_NONCEBYTES;

void
encodePlaintext(NotePlaintext const& note, std::uint8_t* out)
{
    for (std::size_t i = 0; i < 8; ++i)
        out[i] = static_cast<std::uint8_t>((note.amount >> (8 * i)) & 0xFF);
    auto const blinding = fieldToLE(note.blinding);
    std::copy(blinding.begin(), blinding.end(), out + 8);
}

}  // namespace

ripple::Blob
encryptNote(X25519Key const& recipientPk, NotePlaintext const& note)
{
    if (sodium_init() < 0)
        throw std::runtime_error("libsodium initialization failed");

    X25519Key esk;
    randombytes_buf(esk.data(), esk.size());

    ripple::Blob out(ENC_LEN);
    if (crypto_scalarmult_base(out.data(), esk.data()) != 0)
        throw std::logic_error("Could not create ephemeral public key");

    std::uint8_t shared[crypto_scalarmult_BYTES];
    if (crypto_scalarmult(shared, esk.data(), recipientPk.data()) != 0)
    {
        sodium_memzero(esk.data(), esk.size());
        throw PoolError(
            ErrorCode::InvalidCiphertext,
            "Recipient encryption key is not a valid X25519 point");
    }
    sodium_memzero(esk.data(), esk.size());

    randombytes_buf(out.data() + nonceOffset, crypto_secretbox_NONCEBYTES);

    std::uint8_t plaintext[NOTE_PLAINTEXT_SIZE];
    encodePlaintext(note, plaintext);

    int const rc = crypto_secretbox_easy(
        out.data() + boxOffset,
        plaintext,
        sizeof(plaintext),
        out.data() + nonceOffset,
        shared);
    sodium_memzero(shared, sizeof(shared));
    sodium_memzero(plaintext, sizeof(plaintext));
    if (rc != 0)
        throw std::logic_error("crypto_secretbox_easy failed");

    return out;
}

std::optional<NotePlaintext>
decryptNote(X25519Key const& secretKey, ripple::Blob const& ciphertext)
{
    if (ciphertext.size() < ENC_LEN)
        throw PoolError(
            ErrorCode::InvalidCiphertext,
            "Encrypted note too short: " + std::to_string(ciphertext.size()) +
                " bytes");

    if (sodium_init() < 0)
        throw std::runtime_error("libsodium initialization failed");

    std::uint8_t shared[crypto_scalarmult_BYTES];
    if (crypto_scalarmult(shared, secretKey.data(), ciphertext.data()) != 0)
        return std::nullopt;

    std::size_t const boxSize = ciphertext.size() - boxOffset;
    ripple::Blob plaintext(boxSize - crypto_secretbox_MACBYTES);
    int const rc = crypto_secretbox_open_easy(
        plaintext.data(),
        ciphertext.data() + boxOffset,
        boxSize,
        ciphertext.data() + nonceOffset,
        shared);
    sodium_memzero(shared, sizeof(shared));
    if (rc != 0 || plaintext.size() < NOTE_PLAINTEXT_SIZE)
        return std::nullopt;

    NotePlaintext note;
    note.amount = 0;
    for (std::size_t i = 8; i-- > 0;)
        note.amount = (note.amount << 8) | plaintext[i];

    FieldBytes blinding;
    std::copy(plaintext.begin() + 8, plaintext.begin() + 40, blinding.begin());
    sodium_memzero(plaintext.data(), plaintext.size());
    try
    {
        note.blinding = fieldFromLE(blinding);
    }
    catch (PoolError const& e)
    {
        if (e.code() != ErrorCode::FieldOverflow)
            throw;
        return std::nullopt;
    }
    return note;
}

}  // namespace zkp
}  // namespace novapool
