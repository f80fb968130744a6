#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/strHex.h>
#include <libff/common/profiling.hpp>
#include <gmp.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <vector>

namespace novapool {
namespace zkp {

namespace {

using BigInt = libff::bigint<libff::alt_bn128_r_limbs>;

constexpr std::size_t limbBytes = sizeof(mp_limb_t);

BigInt
bigintFromLE(FieldBytes const& bytes)
{
    BigInt result;
    for (std::size_t limb = 0; limb < libff::alt_bn128_r_limbs; ++limb)
    {
        mp_limb_t value = 0;
        for (std::size_t i = limbBytes; i-- > 0;)
        {
            std::size_t const index = limb * limbBytes + i;
            value <<= 8;
            if (index < bytes.size())
                value |= bytes[index];
        }
        result.data[limb] = value;
    }
    return result;
}

bool
belowModulus(BigInt const& value)
{
    return mpn_cmp(
               value.data,
               libff::alt_bn128_modulus_r.data,
               libff::alt_bn128_r_limbs) < 0;
}

FieldT
fromMpz(mpz_t value)
{
    // value must already be in [0, p)
    return FieldT(BigInt(value));
}

}  // namespace

void
initCurve()
{
    static std::once_flag once;
    std::call_once(once, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        DefaultCurve::init_public_params();
    });
}

FieldT
fieldFromLE(FieldBytes const& bytes)
{
    auto const value = bigintFromLE(bytes);
    if (!belowModulus(value))
        throw PoolError(
            ErrorCode::FieldOverflow, "Value is not a canonical field element");
    return FieldT(value);
}

FieldT
fieldFromBE(FieldBytes const& bytes)
{
    FieldBytes le;
    std::reverse_copy(bytes.begin(), bytes.end(), le.begin());
    return fieldFromLE(le);
}

FieldT
fieldFromLEReduced(std::uint8_t const* data, std::size_t size)
{
    std::vector<std::uint8_t> be(data, data + size);
    std::reverse(be.begin(), be.end());
    return fieldFromBEReduced(be.data(), be.size());
}

FieldT
fieldFromBEReduced(std::uint8_t const* data, std::size_t size)
{
    mpz_t value, modulus;
    mpz_init(value);
    mpz_init(modulus);
    if (size > 0)
        mpz_import(value, size, 1, 1, 1, 0, data);
    libff::alt_bn128_modulus_r.to_mpz(modulus);
    mpz_mod(value, value, modulus);
    FieldT result = fromMpz(value);
    mpz_clear(modulus);
    mpz_clear(value);
    return result;
}

FieldBytes
fieldToLE(FieldT const& x)
{
    auto const value = x.as_bigint();
    FieldBytes out{};
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        std::size_t const limb = i / limbBytes;
        std::size_t const shift = (i % limbBytes) * 8;
        out[i] = static_cast<std::uint8_t>((value.data[limb] >> shift) & 0xFF);
    }
    return out;
}

FieldBytes
fieldToBE(FieldT const& x)
{
    auto out = fieldToLE(x);
    std::reverse(out.begin(), out.end());
    return out;
}

std::string
fieldToDecimal(FieldT const& x)
{
    mpz_t value;
    mpz_init(value);
    x.as_bigint().to_mpz(value);
    std::vector<char> buffer(mpz_sizeinbase(value, 10) + 2);
    mpz_get_str(buffer.data(), 10, value);
    mpz_clear(value);
    return std::string(buffer.data());
}

FieldT
fieldFromDecimal(std::string const& decimal)
{
    if (decimal.empty() ||
        !std::all_of(decimal.begin(), decimal.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
        throw std::invalid_argument("Not a decimal field element: " + decimal);

    mpz_t value, modulus;
    mpz_init(value);
    mpz_init(modulus);
    mpz_set_str(value, decimal.c_str(), 10);
    libff::alt_bn128_modulus_r.to_mpz(modulus);
    bool const overflow = mpz_cmp(value, modulus) >= 0;
    FieldT result = overflow ? FieldT::zero() : fromMpz(value);
    mpz_clear(modulus);
    mpz_clear(value);
    if (overflow)
        throw PoolError(
            ErrorCode::FieldOverflow,
            "Decimal value exceeds the field modulus");
    return result;
}

std::string
fieldToHex(FieldT const& x)
{
    auto const be = fieldToBE(x);
    std::string hex = ripple::strHex(be.begin(), be.end());
    std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return "0x" + hex;
}

FieldT
fieldFromHex(std::string const& hex)
{
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' &&
        (digits[1] == 'x' || digits[1] == 'X'))
        digits = digits.substr(2);

    if (digits.empty() || digits.size() > 64 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
            return std::isxdigit(c) != 0;
        }))
        throw PoolError(ErrorCode::InvalidHex, "Invalid hex field element: " + hex);

    digits.insert(0, 64 - digits.size(), '0');
    auto const raw = ripple::strUnHex(digits);
    if (!raw || raw->size() != 32)
        throw PoolError(ErrorCode::InvalidHex, "Invalid hex field element: " + hex);

    FieldBytes be;
    std::copy(raw->begin(), raw->end(), be.begin());
    return fieldFromBE(be);
}

FieldT
fieldFromU64(std::uint64_t value)
{
    FieldBytes le{};
    for (std::size_t i = 0; i < 8; ++i)
        le[i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
    return fieldFromLE(le);
}

ripple::uint256
fieldToUint256(FieldT const& x)
{
    auto const le = fieldToLE(x);
    ripple::uint256 result;
    std::memcpy(result.data(), le.data(), le.size());
    return result;
}

FieldT
fieldFromUint256(ripple::uint256 const& value)
{
    FieldBytes le;
    std::memcpy(le.data(), value.data(), le.size());
    return fieldFromLE(le);
}

FieldT
fieldFromAmount(Amount const& amount)
{
    Amount const magnitude = amount < 0 ? Amount(-amount) : amount;
    if (magnitude >= fieldModulus())
        throw PoolError(
            ErrorCode::FieldOverflow, "Amount does not fit the field");

    FieldT const value = fieldFromDecimal(magnitude.str());
    return amount < 0 ? -value : value;
}

Amount
amountFromField(FieldT const& x)
{
    return Amount(fieldToDecimal(x).c_str());
}

Amount const&
fieldModulus()
{
    static Amount const modulus((std::string("0x") + BN254_FR_HEX).c_str());
    return modulus;
}

Amount const&
maxNoteAmount()
{
    static Amount const bound = Amount(1) << 248;
    return bound;
}

}  // namespace zkp
}  // namespace novapool
