#pragma once

#include <xrpl/basics/base_uint.h>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace novapool {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;

/** 32-byte encoding of a field element. */
using FieldBytes = std::array<std::uint8_t, 32>;

/** Signed amount (ext_amount, fee and note amounts before reduction). */
using Amount = boost::multiprecision::cpp_int;

/** BN254 scalar field modulus, big-endian hex. */
constexpr char BN254_FR_HEX[] =
    "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";

/**
 * Initialize the alt_bn128 curve parameters. Safe to call from any
 * thread, any number of times.
 */
void
initCurve();

// Strict conversions: the encoded integer must be < BN254_FR,
// otherwise FieldOverflow is thrown.
FieldT
fieldFromLE(FieldBytes const& bytes);
FieldT
fieldFromBE(FieldBytes const& bytes);

// Reducing conversions (x mod BN254_FR).
FieldT
fieldFromLEReduced(std::uint8_t const* data, std::size_t size);
FieldT
fieldFromBEReduced(std::uint8_t const* data, std::size_t size);

FieldBytes
fieldToLE(FieldT const& x);
FieldBytes
fieldToBE(FieldT const& x);

/** Decimal representation used on the witness wire. */
std::string
fieldToDecimal(FieldT const& x);
FieldT
fieldFromDecimal(std::string const& decimal);

/** "0x"-prefixed, zero-padded, big-endian lowercase hex. */
std::string
fieldToHex(FieldT const& x);
FieldT
fieldFromHex(std::string const& hex);

FieldT
fieldFromU64(std::uint64_t value);

/** Little-endian field bytes held in a uint256 (key for ordered maps). */
ripple::uint256
fieldToUint256(FieldT const& x);
FieldT
fieldFromUint256(ripple::uint256 const& value);

/** Map a signed amount into the field: negative x becomes p - |x|. */
FieldT
fieldFromAmount(Amount const& amount);

/** The field element as a non-negative integer. */
Amount
amountFromField(FieldT const& x);

/** The modulus as an integer. */
Amount const&
fieldModulus();

/** 2^248, the bound on note amounts enforced by the circuit. */
Amount const&
maxNoteAmount();

}  // namespace zkp
}  // namespace novapool
