#include <libnovapool/zkp/KeyDerivation.h>
#include <libnovapool/zkp/PoolError.h>
#include <libnovapool/zkp/Signer.h>

#include <openssl/rand.h>
#include <openssl/sha.h>
#include <sodium.h>

#include <optional>
#include <stdexcept>

namespace novapool {
namespace zkp {

namespace {

constexpr unsigned maxKdfCounter = 255;

FieldBytes
sha256(ripple::Blob const& data, std::optional<std::uint8_t> counter)
{
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    if (counter)
    {
        std::uint8_t const c = *counter;
        SHA256_Update(&ctx, &c, 1);
    }
    FieldBytes digest;
    SHA256_Final(digest.data(), &ctx);
    return digest;
}

void
checkSignature(ripple::Blob const& signature)
{
    if (signature.size() != SIGNATURE_SIZE)
        throw PoolError(
            ErrorCode::SignerError,
            "Expected a " + std::to_string(SIGNATURE_SIZE) +
                "-byte signature, got " + std::to_string(signature.size()));
}

void
initSodium()
{
    if (sodium_init() < 0)
        throw std::runtime_error("libsodium initialization failed");
}

ripple::Blob
requestSignature(Signer& signer, std::string const& message)
{
    try
    {
        return signer.signMessage(message);
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

}  // namespace

FieldT
deriveSpendingKey(ripple::Blob const& signature)
{
    checkSignature(signature);

    auto digest = sha256(signature, std::nullopt);
    for (unsigned counter = 1;; ++counter)
    {
        try
        {
            return fieldFromLE(digest);
        }
        catch (PoolError const& e)
        {
            if (e.code() != ErrorCode::FieldOverflow || counter > maxKdfCounter)
                throw;
        }
        digest = sha256(signature, static_cast<std::uint8_t>(counter));
    }
}

FieldT
derivePublicKey(Poseidon2 const& hasher, FieldT const& sk)
{
    return hasher.hash2(sk, FieldT::zero(), domain::keypair);
}

X25519Key
x25519PublicKey(X25519Key const& secret)
{
    initSodium();
    X25519Key pk;
    if (crypto_scalarmult_base(pk.data(), secret.data()) != 0)
        throw PoolError(
            ErrorCode::SignerError, "Could not derive X25519 public key");
    return pk;
}

EncryptionKeyPair
deriveEncryptionKeyPair(ripple::Blob const& signature)
{
    checkSignature(signature);

    EncryptionKeyPair keys;
    keys.secretKey = sha256(signature, std::nullopt);
    keys.publicKey = x25519PublicKey(keys.secretKey);
    return keys;
}

void
randomBytes(std::uint8_t* out, std::size_t size)
{
    if (RAND_bytes(out, static_cast<int>(size)) != 1)
        throw std::runtime_error("RAND_bytes failed");
}

FieldT
randomBlinding()
{
    FieldBytes bytes;
    for (;;)
    {
        randomBytes(bytes.data(), bytes.size());
        // keep 254 bits so that roughly three draws in four are canonical
        bytes[31] &= 0x3F;
        try
        {
            return fieldFromLE(bytes);
        }
        catch (PoolError const& e)
        {
            if (e.code() != ErrorCode::FieldOverflow)
                throw;
        }
    }
}

UserKeys
deriveUserKeys(Signer& signer, Poseidon2 const& hasher)
{
    auto const spendingSig = requestSignature(signer, SPENDING_KEY_MESSAGE);
    auto const encryptionSig =
        requestSignature(signer, ENCRYPTION_KEY_MESSAGE);

    if (spendingSig == encryptionSig)
        throw PoolError(
            ErrorCode::SignerError,
            "Spending and encryption keys must come from distinct signatures");

    UserKeys keys;
    keys.spending.sk = deriveSpendingKey(spendingSig);
    keys.spending.pk = derivePublicKey(hasher, keys.spending.sk);
    keys.encryption = deriveEncryptionKeyPair(encryptionSig);
    return keys;
}

}  // namespace zkp
}  // namespace novapool
