#include <libnovapool/zkp/ExtData.h>
#include <libnovapool/zkp/Keccak.h>
#include <libnovapool/zkp/PoolError.h>

#include <algorithm>
#include <utility>

namespace novapool {
namespace zkp {

namespace {

// ScValType discriminants
constexpr std::uint32_t SCV_U256 = 11;
constexpr std::uint32_t SCV_I256 = 12;
constexpr std::uint32_t SCV_BYTES = 13;
constexpr std::uint32_t SCV_SYMBOL = 15;
constexpr std::uint32_t SCV_MAP = 17;
constexpr std::uint32_t SCV_ADDRESS = 18;

constexpr std::uint32_t SC_ADDRESS_TYPE_ACCOUNT = 0;
constexpr std::uint32_t SC_ADDRESS_TYPE_CONTRACT = 1;
constexpr std::uint32_t PUBLIC_KEY_TYPE_ED25519 = 0;

constexpr std::uint8_t VERSION_ACCOUNT_ID = 6 << 3;
constexpr std::uint8_t VERSION_CONTRACT = 2 << 3;

constexpr char base32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::uint16_t
crc16XModem(std::uint8_t const* data, std::size_t size)
{
    std::uint16_t crc = 0;
    for (std::size_t i = 0; i < size; ++i)
    {
        crc ^= static_cast<std::uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit)
        {
            if (crc & 0x8000)
                crc = static_cast<std::uint16_t>((crc << 1) ^ 0x1021);
            else
                crc = static_cast<std::uint16_t>(crc << 1);
        }
    }
    return crc;
}

std::string
base32Encode(ripple::Blob const& data)
{
    std::string out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (auto const byte : data)
    {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5)
        {
            out.push_back(base32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0)
        out.push_back(base32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    return out;
}

std::optional<ripple::Blob>
base32Decode(std::string const& text)
{
    ripple::Blob out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (auto const c : text)
    {
        auto const* pos = std::find(
            std::begin(base32Alphabet), std::end(base32Alphabet) - 1, c);
        if (pos == std::end(base32Alphabet) - 1)
            return std::nullopt;
        buffer = (buffer << 5) | static_cast<std::uint32_t>(pos - base32Alphabet);
        bits += 5;
        if (bits >= 8)
        {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    // leftover bits must be zero padding
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0)
        return std::nullopt;
    return out;
}

class XdrWriter
{
public:
    void
    u32(std::uint32_t v)
    {
        for (int shift = 24; shift >= 0; shift -= 8)
            out_.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
    }

    void
    fixed(std::uint8_t const* data, std::size_t size)
    {
        out_.insert(out_.end(), data, data + size);
    }

    void
    opaque(std::uint8_t const* data, std::size_t size)
    {
        u32(static_cast<std::uint32_t>(size));
        fixed(data, size);
        while (out_.size() % 4 != 0)
            out_.push_back(0);
    }

    void
    symbol(std::string const& s)
    {
        u32(SCV_SYMBOL);
        opaque(reinterpret_cast<std::uint8_t const*>(s.data()), s.size());
    }

    void
    bytes(ripple::Blob const& b)
    {
        u32(SCV_BYTES);
        opaque(b.data(), b.size());
    }

    // 256-bit integer as hi_hi, hi_lo, lo_hi, lo_lo: 32 bytes big-endian
    // two's complement
    void
    int256(std::uint32_t type, Amount const& value)
    {
        Amount encoded = value;
        if (encoded < 0)
            encoded += Amount(1) << 256;
        std::uint8_t be[32] = {};
        for (int i = 31; i >= 0; --i)
        {
            Amount const low = encoded & 0xFF;
            be[i] = low.convert_to<std::uint8_t>();
            encoded >>= 8;
        }
        u32(type);
        fixed(be, sizeof(be));
    }

    void
    address(StrKey const& key)
    {
        u32(SCV_ADDRESS);
        if (key.type == AddressType::Account)
        {
            u32(SC_ADDRESS_TYPE_ACCOUNT);
            u32(PUBLIC_KEY_TYPE_ED25519);
        }
        else
        {
            u32(SC_ADDRESS_TYPE_CONTRACT);
        }
        fixed(key.payload.data(), key.payload.size());
    }

    ripple::Blob
    release()
    {
        return std::move(out_);
    }

private:
    ripple::Blob out_;
};

void
checkI256(Amount const& value, char const* what)
{
    Amount const limit = Amount(1) << 255;
    if (value >= limit || value < -limit)
        throw PoolError(
            ErrorCode::FieldOverflow,
            std::string(what) + " does not fit in a signed 256-bit integer");
}

}  // namespace

StrKey
decodeStrKey(std::string const& address)
{
    auto invalid = [&address](char const* why) {
        return PoolError(
            ErrorCode::InvalidAddress,
            "Invalid Stellar address '" + address + "': " + why);
    };

    if (address.size() != 56)
        throw invalid("expected 56 characters");

    auto const raw = base32Decode(address);
    if (!raw || raw->size() != 35)
        throw invalid("not base32");

    StrKey key;
    auto const version = (*raw)[0];
    if (version == VERSION_ACCOUNT_ID)
        key.type = AddressType::Account;
    else if (version == VERSION_CONTRACT)
        key.type = AddressType::Contract;
    else
        throw invalid("unsupported version byte");

    auto const expected = crc16XModem(raw->data(), 33);
    auto const actual = static_cast<std::uint16_t>((*raw)[33]) |
        static_cast<std::uint16_t>((*raw)[34] << 8);
    if (expected != actual)
        throw invalid("checksum mismatch");

    std::copy(raw->begin() + 1, raw->begin() + 33, key.payload.begin());
    return key;
}

std::string
encodeStrKey(StrKey const& key)
{
    ripple::Blob raw;
    raw.reserve(35);
    raw.push_back(
        key.type == AddressType::Account ? VERSION_ACCOUNT_ID
                                         : VERSION_CONTRACT);
    raw.insert(raw.end(), key.payload.begin(), key.payload.end());
    auto const crc = crc16XModem(raw.data(), raw.size());
    raw.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    raw.push_back(static_cast<std::uint8_t>(crc >> 8));
    return base32Encode(raw);
}

ripple::Blob
serializeExtData(ExtData const& extData)
{
    auto const recipient = decodeStrKey(extData.recipient);
    checkI256(extData.extAmount, "ext_amount");
    if (extData.fee && (*extData.fee < 0 || *extData.fee >= Amount(1) << 256))
        throw PoolError(
            ErrorCode::FieldOverflow,
            "fee does not fit in an unsigned 256-bit integer");

    XdrWriter w;
    w.u32(SCV_MAP);
    w.u32(1);  // Option<ScMap> is present
    w.u32(extData.fee ? 5 : 4);

    w.symbol("encrypted_output0");
    w.bytes(extData.encryptedOutput0);

    w.symbol("encrypted_output1");
    w.bytes(extData.encryptedOutput1);

    w.symbol("ext_amount");
    w.int256(SCV_I256, extData.extAmount);

    if (extData.fee)
    {
        w.symbol("fee");
        w.int256(SCV_U256, *extData.fee);
    }

    w.symbol("recipient");
    w.address(recipient);

    return w.release();
}

ExtDataHash
hashExtData(ExtData const& extData)
{
    auto const xdr = serializeExtData(extData);
    auto const digest = keccak256(xdr);

    ExtDataHash result;
    result.field = fieldFromBEReduced(digest.data(), digest.size());
    result.bytesBE = fieldToBE(result.field);
    return result;
}

FieldT
calculatePublicAmount(Amount const& extAmount, Amount const& fee)
{
    auto const& bound = maxNoteAmount();
    if (fee < 0 || fee >= bound)
        throw PoolError(ErrorCode::FieldOverflow, "invalid fee");
    if (abs(extAmount) >= bound)
        throw PoolError(ErrorCode::FieldOverflow, "invalid ext amount");

    return fieldFromAmount(extAmount - fee);
}

}  // namespace zkp
}  // namespace novapool
