#pragma once

#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/Poseidon2.h>
#include <xrpl/basics/Blob.h>
#include <array>

namespace novapool {
namespace zkp {

class Signer;

/** Wallet message whose signature seeds the BN254 spending key. */
constexpr char SPENDING_KEY_MESSAGE[] = "Privacy Pool Spending Key [v1]";

/** Wallet message whose signature seeds the X25519 note encryption key. */
constexpr char ENCRYPTION_KEY_MESSAGE[] = "Sign to access Privacy Pool [v1]";

constexpr std::size_t SIGNATURE_SIZE = 64;

using X25519Key = std::array<std::uint8_t, 32>;

struct EncryptionKeyPair
{
    X25519Key publicKey;
    X25519Key secretKey;
};

/** Spending identity: sk and pk = Poseidon2(sk, 0, keypair). */
struct SpendingKey
{
    FieldT sk;
    FieldT pk;
};

struct UserKeys
{
    SpendingKey spending;
    EncryptionKeyPair encryption;
};

/**
 * sk = SHA256(signature) read little-endian. When the digest is not a
 * canonical field element it is re-hashed as SHA256(signature || n) for
 * n = 1, 2, ... until one is.
 */
FieldT
deriveSpendingKey(ripple::Blob const& signature);

FieldT
derivePublicKey(Poseidon2 const& hasher, FieldT const& sk);

/** X25519 keypair whose secret is SHA256(signature). */
EncryptionKeyPair
deriveEncryptionKeyPair(ripple::Blob const& signature);

/** X25519 public key for a secret (clamping applied). */
X25519Key
x25519PublicKey(X25519Key const& secret);

/** Uniformly random field element from the OpenSSL CSPRNG. */
FieldT
randomBlinding();

/** Fill a buffer from the OpenSSL CSPRNG. */
void
randomBytes(std::uint8_t* out, std::size_t size);

/**
 * Ask the signer for both key signatures and derive the user's keys.
 * The two signatures must differ.
 */
UserKeys
deriveUserKeys(Signer& signer, Poseidon2 const& hasher);

}  // namespace zkp
}  // namespace novapool
