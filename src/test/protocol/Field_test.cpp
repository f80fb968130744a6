#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/PoolError.h>
#include <test/support/ExpectError.h>

#include <xrpl/beast/unit_test.h>

namespace novapool {

using namespace zkp;
using test::throwsCode;
using test::throwsType;

class Field_test : public beast::unit_test::suite
{
    void
    testDecimal()
    {
        testcase("Decimal conversions");

        BEAST_EXPECT(fieldToDecimal(fieldFromU64(500000)) == "500000");
        BEAST_EXPECT(fieldToDecimal(FieldT::zero()) == "0");
        BEAST_EXPECT(fieldFromDecimal("303") == fieldFromU64(303));

        // p - 1 is the largest canonical value
        auto const pMinusOne = (fieldModulus() - 1).str();
        BEAST_EXPECT(fieldToDecimal(-FieldT::one()) == pMinusOne);
        BEAST_EXPECT(fieldFromDecimal(pMinusOne) == -FieldT::one());

        BEAST_EXPECT(throwsCode(ErrorCode::FieldOverflow, [] {
            fieldFromDecimal(fieldModulus().str());
        }));
        BEAST_EXPECT(throwsType<std::invalid_argument>(
            [] { fieldFromDecimal("12a"); }));
        BEAST_EXPECT(
            throwsType<std::invalid_argument>([] { fieldFromDecimal(""); }));
    }

    void
    testHex()
    {
        testcase("Hex conversions");

        std::string const leaf =
            "0x25302288db99350344974183ce310d63b53abb9ef0f8575753eed36e0118f9ce";
        BEAST_EXPECT(fieldToHex(fieldFromHex(leaf)) == leaf);
        BEAST_EXPECT(fieldFromHex("0x1") == FieldT::one());
        BEAST_EXPECT(fieldFromHex("ff") == fieldFromU64(255));
        BEAST_EXPECT(
            fieldToHex(fieldFromU64(1)) ==
            "0x0000000000000000000000000000000000000000000000000000000000000001");

        BEAST_EXPECT(throwsCode(ErrorCode::FieldOverflow, [] {
            fieldFromHex(std::string("0x") + BN254_FR_HEX);
        }));
        BEAST_EXPECT(
            throwsCode(ErrorCode::InvalidHex, [] { fieldFromHex("0xzz"); }));
        BEAST_EXPECT(throwsCode(ErrorCode::InvalidHex, [] {
            fieldFromHex(std::string(65, '1'));
        }));
        BEAST_EXPECT(throwsCode(ErrorCode::InvalidHex, [] { fieldFromHex("0x"); }));
    }

    void
    testBytes()
    {
        testcase("Byte encodings");

        auto const x = fieldFromU64(0x0102);
        auto const le = fieldToLE(x);
        auto const be = fieldToBE(x);
        BEAST_EXPECT(le[0] == 0x02 && le[1] == 0x01 && le[31] == 0);
        BEAST_EXPECT(be[31] == 0x02 && be[30] == 0x01 && be[0] == 0);
        BEAST_EXPECT(fieldFromLE(le) == x);
        BEAST_EXPECT(fieldFromBE(be) == x);

        FieldBytes ones;
        ones.fill(0xFF);
        BEAST_EXPECT(throwsCode(ErrorCode::FieldOverflow, [&] { fieldFromLE(ones); }));

        // Reduction: (2^256 - 1) mod p
        auto const reduced = fieldFromLEReduced(ones.data(), ones.size());
        Amount const all = (Amount(1) << 256) - 1;
        BEAST_EXPECT(amountFromField(reduced) == all % fieldModulus());
        BEAST_EXPECT(fieldFromBEReduced(ones.data(), ones.size()) == reduced);

        BEAST_EXPECT(fieldFromUint256(fieldToUint256(x)) == x);
    }

    void
    testAmounts()
    {
        testcase("Signed amounts");

        BEAST_EXPECT(fieldFromAmount(Amount(-1)) == -FieldT::one());
        BEAST_EXPECT(fieldFromAmount(Amount(250000)) == fieldFromU64(250000));
        BEAST_EXPECT(
            fieldFromAmount(Amount(-250000)) + fieldFromU64(250000) ==
            FieldT::zero());
        BEAST_EXPECT(amountFromField(-FieldT::one()) == fieldModulus() - 1);
        BEAST_EXPECT(maxNoteAmount() == (Amount(1) << 248));

        BEAST_EXPECT(throwsCode(ErrorCode::FieldOverflow, [] {
            fieldFromAmount(fieldModulus());
        }));
        BEAST_EXPECT(throwsCode(ErrorCode::FieldOverflow, [] {
            fieldFromAmount(Amount(-fieldModulus()));
        }));
    }

public:
    void
    run() override
    {
        initCurve();
        testDecimal();
        testHex();
        testBytes();
        testAmounts();
    }
};

BEAST_DEFINE_TESTSUITE(Field, protocol, novapool);

}  // namespace novapool
