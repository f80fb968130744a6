#include <libnovapool/zkp/NoteEncryption.h>
#include <libnovapool/zkp/NoteScanner.h>
#include <test/support/ExpectError.h>
#include <test/support/TestPermutation.h>

#include <xrpl/beast/unit_test.h>

namespace novapool {

using namespace zkp;

class NoteScanner_test : public beast::unit_test::suite
{
    struct Fixture
    {
        Poseidon2 hasher = test::testHasher();
        PoolStore pool{hasher, 5, 10, test::nullJournal()};
        MemoryNoteStore notes{test::nullJournal()};
        NoteScanner scanner{hasher, pool, notes, test::nullJournal()};
        UserKeys keys;
        UserKeys other;

        Fixture()
        {
            keys.spending.sk = fieldFromU64(42);
            keys.spending.pk = derivePublicKey(hasher, keys.spending.sk);
            keys.encryption =
                deriveEncryptionKeyPair(ripple::Blob(SIGNATURE_SIZE, 1));
            other.spending.sk = fieldFromU64(43);
            other.spending.pk = derivePublicKey(hasher, other.spending.sk);
            other.encryption =
                deriveEncryptionKeyPair(ripple::Blob(SIGNATURE_SIZE, 2));
        }

        /** Append an output sealed for owner with the given opening. */
        Note
        append(
            UserKeys const& owner,
            std::uint64_t amount,
            std::uint64_t blinding,
            std::uint32_t ledger)
        {
            Note const note(amount, owner.spending.pk, fieldFromU64(blinding));
            pool.processNewCommitment(
                note.commitment(hasher),
                pool.nextIndex(),
                encryptNote(
                    owner.encryption.publicKey,
                    NotePlaintext{amount, note.blinding}),
                ledger);
            return note;
        }

        void
        appendRaw(
            FieldT const& commitment,
            ripple::Blob const& encrypted,
            std::uint32_t ledger)
        {
            pool.processNewCommitment(
                commitment, pool.nextIndex(), encrypted, ledger);
        }
    };

    void
    testTryOpen()
    {
        testcase("Open a single output");

        Fixture f;
        auto const note = f.append(f.keys, 500, 7, 10);
        auto const output = f.pool.encryptedOutputs().front();

        auto const stored = f.scanner.tryOpen(f.keys, output);
        if (!BEAST_EXPECT(stored))
            return;
        BEAST_EXPECT(stored->note.amount == 500);
        BEAST_EXPECT(stored->note.pk == f.keys.spending.pk);
        BEAST_EXPECT(stored->note.blinding == fieldFromU64(7));
        BEAST_EXPECT(stored->commitment == note.commitment(f.hasher));
        BEAST_EXPECT(stored->leafIndex == 0);
        BEAST_EXPECT(
            stored->nullifier ==
            spendNullifier(f.hasher, note, f.keys.spending.sk, 0));
        BEAST_EXPECT(stored->createdAtLedger == 10);
        BEAST_EXPECT(!stored->spent);

        BEAST_EXPECT(!f.scanner.tryOpen(f.other, output));

        // Already revealed nullifier
        f.pool.processNewNullifier(stored->nullifier, 12);
        auto const spent = f.scanner.tryOpen(f.keys, output);
        BEAST_EXPECT(spent && spent->spent && *spent->spentAtLedger == 12);
    }

    void
    testScan()
    {
        testcase("Scan");

        Fixture f;
        auto const mine = f.append(f.keys, 500, 7, 10);
        f.append(f.other, 800, 8, 10);
        // Sealed for us, but the commitment hides a different amount
        {
            Note const claimed(501, f.keys.spending.pk, fieldFromU64(9));
            f.appendRaw(
                claimed.commitment(f.hasher),
                encryptNote(
                    f.keys.encryption.publicKey,
                    NotePlaintext{500, fieldFromU64(9)}),
                11);
        }
        // Malformed outputs are skipped
        f.appendRaw(fieldFromU64(1234), ripple::Blob(10, 0xab), 11);
        f.appendRaw(fieldFromU64(1235), {}, 11);
        // Zero amount notes are dummies
        f.append(f.keys, 0, 10, 11);
        auto const later = f.append(f.keys, 25, 11, 12);

        auto result = f.scanner.scan(f.keys);
        BEAST_EXPECT(result.scanned == 7);
        BEAST_EXPECT(result.found == 2);
        BEAST_EXPECT(result.alreadyKnown == 0);
        BEAST_EXPECT(result.markedSpent == 0);
        BEAST_EXPECT(f.notes.size() == 2);
        BEAST_EXPECT(f.notes.balance() == 525);

        auto const stored = f.notes.get(later.commitment(f.hasher));
        BEAST_EXPECT(stored && stored->leafIndex == 6);

        result = f.scanner.scan(f.keys);
        BEAST_EXPECT(result.found == 0);
        BEAST_EXPECT(result.alreadyKnown == 2);

        // Only outputs from ledger 12 on
        result = f.scanner.scan(f.keys, 12);
        BEAST_EXPECT(result.scanned == 1);
        BEAST_EXPECT(result.alreadyKnown == 1);

        // The other user sees only their note
        MemoryNoteStore otherNotes(test::nullJournal());
        NoteScanner otherScanner(
            f.hasher, f.pool, otherNotes, test::nullJournal());
        BEAST_EXPECT(otherScanner.scan(f.other).found == 1);
        BEAST_EXPECT(otherNotes.balance() == 800);

        auto const nullifier =
            spendNullifier(f.hasher, mine, f.keys.spending.sk, 0);
        BEAST_EXPECT(f.notes.getByNullifier(nullifier));
    }

    void
    testMarkSpent()
    {
        testcase("Mark spent notes");

        Fixture f;
        auto const first = f.append(f.keys, 100, 1, 10);
        f.append(f.keys, 200, 2, 10);
        f.scanner.scan(f.keys);
        BEAST_EXPECT(f.notes.balance() == 300);

        BEAST_EXPECT(f.scanner.markSpentNotes() == 0);

        auto const nullifier =
            spendNullifier(f.hasher, first, f.keys.spending.sk, 0);
        f.pool.processNewNullifier(nullifier, 15);
        // Nullifiers of notes we do not hold are ignored
        f.pool.processNewNullifier(fieldFromU64(999), 15);

        auto const result = f.scanner.scan(f.keys);
        BEAST_EXPECT(result.markedSpent == 1);
        BEAST_EXPECT(f.notes.balance() == 200);

        auto const stored = f.notes.get(first.commitment(f.hasher));
        BEAST_EXPECT(stored && stored->spent);
        BEAST_EXPECT(stored && stored->spentAtLedger == 15u);
        BEAST_EXPECT(f.notes.list(true).size() == 1);

        BEAST_EXPECT(f.scanner.markSpentNotes() == 0);
    }

public:
    void
    run() override
    {
        initCurve();
        testTryOpen();
        testScan();
        testMarkSpent();
    }
};

BEAST_DEFINE_TESTSUITE(NoteScanner, protocol, novapool);

}  // namespace novapool
