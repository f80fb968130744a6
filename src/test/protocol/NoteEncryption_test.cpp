#include <libnovapool/zkp/KeyDerivation.h>
#include <libnovapool/zkp/NoteEncryption.h>
#include <test/support/ExpectError.h>

#include <xrpl/beast/unit_test.h>

namespace novapool {

using namespace zkp;
using test::throwsCode;

class NoteEncryption_test : public beast::unit_test::suite
{
    static EncryptionKeyPair
    keysFor(std::uint8_t seed)
    {
        return deriveEncryptionKeyPair(ripple::Blob(SIGNATURE_SIZE, seed));
    }

    void
    testRoundTrip()
    {
        testcase("Seal and open");

        auto const alice = keysFor(1);
        NotePlaintext const note{500000, fieldFromU64(303)};

        auto const sealed = encryptNote(alice.publicKey, note);
        BEAST_EXPECT(sealed.size() == ENC_LEN);

        auto const opened = decryptNote(alice.secretKey, sealed);
        if (!BEAST_EXPECT(opened))
            return;
        BEAST_EXPECT(opened->amount == 500000);
        BEAST_EXPECT(opened->blinding == fieldFromU64(303));

        // Fresh ephemeral key and nonce every time
        BEAST_EXPECT(encryptNote(alice.publicKey, note) != sealed);

        NotePlaintext const big{~std::uint64_t(0), -FieldT::one()};
        auto const bigOpened =
            decryptNote(alice.secretKey, encryptNote(alice.publicKey, big));
        BEAST_EXPECT(bigOpened && bigOpened->amount == big.amount);
        BEAST_EXPECT(bigOpened && bigOpened->blinding == big.blinding);
    }

    void
    testForeignNotes()
    {
        testcase("Notes for someone else");

        auto const alice = keysFor(1);
        auto const bob = keysFor(2);
        auto const sealed =
            encryptNote(alice.publicKey, NotePlaintext{7, fieldFromU64(9)});

        BEAST_EXPECT(!decryptNote(bob.secretKey, sealed));

        // Any flipped bit breaks authentication
        for (std::size_t pos : {0u, 40u, 60u, 111u})
        {
            auto tampered = sealed;
            tampered[pos] ^= 0x01;
            BEAST_EXPECT(!decryptNote(alice.secretKey, tampered));
        }
    }

    void
    testMalformed()
    {
        testcase("Malformed ciphertext");

        auto const alice = keysFor(1);
        BEAST_EXPECT(throwsCode(ErrorCode::InvalidCiphertext, [&] {
            decryptNote(alice.secretKey, ripple::Blob(ENC_LEN - 1, 0));
        }));
        BEAST_EXPECT(throwsCode(ErrorCode::InvalidCiphertext, [&] {
            decryptNote(alice.secretKey, ripple::Blob{});
        }));

        // Well-sized garbage is simply not ours
        BEAST_EXPECT(!decryptNote(alice.secretKey, ripple::Blob(ENC_LEN, 0x5A)));
    }

public:
    void
    run() override
    {
        initCurve();
        testRoundTrip();
        testForeignNotes();
        testMalformed();
    }
};

BEAST_DEFINE_TESTSUITE(NoteEncryption, protocol, novapool);

}  // namespace novapool
