#include <libnovapool/zkp/KeyDerivation.h>
#include <libnovapool/zkp/Note.h>
#include <test/support/ExpectError.h>
#include <test/support/TestPermutation.h>

#include <xrpl/beast/unit_test.h>

namespace novapool {

using namespace zkp;
using test::throwsCode;
using test::throwsType;

class Note_test : public beast::unit_test::suite
{
    void
    testCommitment()
    {
        testcase("Commitment");

        auto const hasher = test::testHasher();
        auto const sk = fieldFromU64(42);
        auto const pk = derivePublicKey(hasher, sk);

        Note const note(500000, pk, fieldFromU64(303));
        BEAST_EXPECT(
            note.commitment(hasher) ==
            hasher.hash3(fieldFromU64(500000), pk, fieldFromU64(303), domain::commitment));
        BEAST_EXPECT(!note.isDummy());

        // Any field changes the commitment
        BEAST_EXPECT(
            Note(500001, pk, fieldFromU64(303)).commitment(hasher) !=
            note.commitment(hasher));
        BEAST_EXPECT(
            Note(500000, pk, fieldFromU64(404)).commitment(hasher) !=
            note.commitment(hasher));
        BEAST_EXPECT(
            Note(500000, pk + FieldT::one(), fieldFromU64(303))
                .commitment(hasher) != note.commitment(hasher));

        BEAST_EXPECT(throwsType<std::invalid_argument>(
            [&] { Note(-1, pk, FieldT::one()).commitment(hasher); }));
    }

    void
    testNullifier()
    {
        testcase("Signature and nullifier");

        auto const hasher = test::testHasher();
        auto const sk = fieldFromU64(42);
        Note const note(1000, derivePublicKey(hasher, sk), fieldFromU64(7));
        auto const cm = note.commitment(hasher);

        auto const sig = noteSignature(hasher, sk, cm, fieldFromU64(3));
        BEAST_EXPECT(
            sig == hasher.hash3(sk, cm, fieldFromU64(3), domain::signature));
        BEAST_EXPECT(
            noteNullifier(hasher, cm, fieldFromU64(3), sig) ==
            hasher.hash3(cm, fieldFromU64(3), sig, domain::nullifier));
        BEAST_EXPECT(
            spendNullifier(hasher, note, sk, 3) ==
            noteNullifier(hasher, cm, fieldFromU64(3), sig));

        // Leaf position and key both bind the nullifier
        BEAST_EXPECT(
            spendNullifier(hasher, note, sk, 3) !=
            spendNullifier(hasher, note, sk, 4));
        BEAST_EXPECT(
            spendNullifier(hasher, note, sk, 3) !=
            spendNullifier(hasher, note, sk + FieldT::one(), 3));
    }

    void
    testDummies()
    {
        testcase("Dummy inputs");

        auto const pk = fieldFromU64(5);
        BEAST_EXPECT(dummyInputBlinding(0) == fieldFromU64(101));
        BEAST_EXPECT(dummyInputBlinding(1) == fieldFromU64(202));

        auto const d0 = dummyInputNote(pk, 0);
        BEAST_EXPECT(d0.isDummy());
        BEAST_EXPECT(d0.pk == pk);
        BEAST_EXPECT(d0.blinding == fieldFromU64(101));

        auto const nonce = fieldFromU64(1000);
        BEAST_EXPECT(dummyInputNote(pk, 1, nonce).blinding == fieldFromU64(1202));
    }

    void
    testJson()
    {
        testcase("JSON");

        Note const note(
            Amount("123456789012345678901234567890"),
            fieldFromU64(77),
            fieldFromU64(88));
        auto const json = note.toJson();
        BEAST_EXPECT(json["amount"].asString() == "123456789012345678901234567890");
        BEAST_EXPECT(json["pk"].asString() == fieldToHex(fieldFromU64(77)));

        auto const back = Note::fromJson(json);
        BEAST_EXPECT(back.amount == note.amount);
        BEAST_EXPECT(back.pk == note.pk);
        BEAST_EXPECT(back.blinding == note.blinding);

        Json::Value missing(Json::objectValue);
        missing["amount"] = "1";
        BEAST_EXPECT(
            throwsType<std::invalid_argument>([&] { Note::fromJson(missing); }));

        auto badHex = json;
        badHex["pk"] = "0xnothex";
        BEAST_EXPECT(
            throwsCode(ErrorCode::InvalidHex, [&] { Note::fromJson(badHex); }));
    }

public:
    void
    run() override
    {
        initCurve();
        testCommitment();
        testNullifier();
        testDummies();
        testJson();
    }
};

BEAST_DEFINE_TESTSUITE(Note, protocol, novapool);

}  // namespace novapool
