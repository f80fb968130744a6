#include <libnovapool/zkp/NoteScanner.h>
#include <libnovapool/zkp/NoteEncryption.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>

#include <utility>

namespace novapool {
namespace zkp {

NoteScanner::NoteScanner(
    Poseidon2 hasher,
    PoolStore const& pool,
    NoteStore& notes,
    beast::Journal journal)
    : hasher_(std::move(hasher)), pool_(pool), notes_(notes), j_(journal)
{
}

std::optional<StoredNote>
NoteScanner::tryOpen(UserKeys const& keys, EncryptedOutputRecord const& output)
    const
{
    std::optional<NotePlaintext> plain;
    try
    {
        plain = decryptNote(keys.encryption.secretKey, output.encryptedOutput);
    }
    catch (PoolError const& e)
    {
        if (e.code() != ErrorCode::InvalidCiphertext)
            throw;
        JLOG(j_.trace()) << "Skipping malformed output " << output.index;
        return std::nullopt;
    }
    if (!plain || plain->amount == 0)
        return std::nullopt;

    Note const note(plain->amount, keys.spending.pk, plain->blinding);
    if (note.commitment(hasher_) != output.commitment)
    {
        JLOG(j_.debug()) << "Output " << output.index
                         << " decrypted but its commitment does not match";
        return std::nullopt;
    }

    StoredNote stored;
    stored.note = note;
    stored.commitment = output.commitment;
    stored.leafIndex = output.index;
    stored.nullifier =
        spendNullifier(hasher_, note, keys.spending.sk, output.index);
    stored.createdAtLedger = output.ledger;
    stored.spentAtLedger = pool_.nullifierLedger(stored.nullifier);
    stored.spent = stored.spentAtLedger.has_value();
    return stored;
}

NoteScanner::ScanResult
NoteScanner::scan(UserKeys const& keys, std::uint32_t fromLedger)
{
    ScanResult result;
    for (auto const& output : pool_.encryptedOutputs(fromLedger))
    {
        ++result.scanned;
        if (notes_.get(output.commitment))
        {
            ++result.alreadyKnown;
            continue;
        }
        if (auto stored = tryOpen(keys, output))
        {
            notes_.put(*stored);
            ++result.found;
        }
    }
    result.markedSpent = markSpentNotes();

    JLOG(j_.info()) << "Scanned " << result.scanned << " outputs, found "
                    << result.found << " new notes";
    return result;
}

std::size_t
NoteScanner::markSpentNotes()
{
    std::size_t marked = 0;
    for (auto const& stored : notes_.list(true))
    {
        if (auto const ledger = pool_.nullifierLedger(stored.nullifier))
        {
            notes_.markSpent(stored.commitment, *ledger);
            ++marked;
        }
    }
    return marked;
}

}  // namespace zkp
}  // namespace novapool
