#pragma once

#include <libnovapool/zkp/PoolError.h>
#include <xrpl/basics/Blob.h>
#include <string>

namespace novapool {
namespace zkp {

struct SignOptions
{
    std::string networkPassphrase;
    std::string address;
};

struct SignedTransaction
{
    std::string signedXdr;  // base64
    std::string signerAddress;
};

struct SignedAuthEntry
{
    std::string signedAuthEntry;  // base64
    std::string signerAddress;
};

/**
 * Wallet holding the user's Stellar account key.
 *
 * Implementations report failures as PoolError with UserRejected when
 * the user cancelled, SignerError otherwise (see walletError).
 */
class Signer
{
public:
    virtual ~Signer() = default;

    /** 64-byte Ed25519 signature over a UTF-8 message. */
    virtual ripple::Blob
    signMessage(std::string const& message) = 0;

    virtual SignedTransaction
    signTransaction(std::string const& xdr, SignOptions const& options) = 0;

    virtual SignedAuthEntry
    signAuthEntry(std::string const& xdr, SignOptions const& options) = 0;

    /** Stellar StrKey of the connected account. */
    virtual std::string
    getAddress() = 0;
};

/**
 * Classify a raw wallet failure. Messages mentioning a rejection,
 * denial or cancellation become UserRejected.
 */
PoolError
walletError(
    std::string const& message,
    std::exception_ptr cause = nullptr);

}  // namespace zkp
}  // namespace novapool
