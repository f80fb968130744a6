#pragma once

#include <libnovapool/zkp/KeyDerivation.h>
#include <libnovapool/zkp/NoteStore.h>
#include <libnovapool/zkp/PoolStore.h>
#include <xrpl/beast/utility/Journal.h>
#include <optional>

namespace novapool {
namespace zkp {

/**
 * Discovers notes addressed to the user.
 *
 * Every encrypted output in the pool log is trial-decrypted with the
 * user's X25519 secret. A successful decryption is only accepted when
 * the opened amount and blinding reproduce the on-chain commitment
 * under the user's pk.
 */
class NoteScanner
{
public:
    struct ScanResult
    {
        std::size_t scanned = 0;
        std::size_t found = 0;
        std::size_t alreadyKnown = 0;
        std::size_t markedSpent = 0;
    };

    NoteScanner(
        Poseidon2 hasher,
        PoolStore const& pool,
        NoteStore& notes,
        beast::Journal journal);

    ScanResult
    scan(UserKeys const& keys, std::uint32_t fromLedger = 0);

    /** Open one output; nothing if it is not ours or carries no value. */
    std::optional<StoredNote>
    tryOpen(UserKeys const& keys, EncryptedOutputRecord const& output) const;

    /** Mark stored notes whose nullifier is on chain. */
    std::size_t
    markSpentNotes();

private:
    Poseidon2 hasher_;
    PoolStore const& pool_;
    NoteStore& notes_;
    beast::Journal j_;
};

}  // namespace zkp
}  // namespace novapool
