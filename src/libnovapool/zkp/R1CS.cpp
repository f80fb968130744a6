#include <libnovapool/zkp/R1CS.h>
#include <libnovapool/zkp/PoolError.h>

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>

namespace novapool {
namespace zkp {

namespace {

constexpr std::uint32_t SECTION_HEADER = 1;
constexpr std::uint32_t SECTION_CONSTRAINTS = 2;

PoolError
malformed(std::string const& why)
{
    return PoolError(ErrorCode::ProverFailure, "Invalid R1CS file: " + why);
}

class Reader
{
public:
    Reader(std::uint8_t const* data, std::size_t size)
        : data_(data), size_(size), pos_(0)
    {
    }

    std::uint8_t const*
    take(std::size_t n)
    {
        if (n > size_ - pos_)
            throw malformed("unexpected end of data");
        auto const* p = data_ + pos_;
        pos_ += n;
        return p;
    }

    std::uint32_t
    u32()
    {
        auto const* p = take(4);
        return std::uint32_t(p[0]) | (std::uint32_t(p[1]) << 8) |
            (std::uint32_t(p[2]) << 16) | (std::uint32_t(p[3]) << 24);
    }

    std::uint64_t
    u64()
    {
        std::uint64_t const lo = u32();
        std::uint64_t const hi = u32();
        return lo | (hi << 32);
    }

    std::size_t
    position() const
    {
        return pos_;
    }

    std::size_t
    remaining() const
    {
        return size_ - pos_;
    }

private:
    std::uint8_t const* data_;
    std::size_t size_;
    std::size_t pos_;
};

struct Section
{
    std::size_t offset;
    std::size_t size;
};

libsnark::linear_combination<FieldT>
readLinearCombination(Reader& r, std::uint32_t nWires)
{
    libsnark::linear_combination<FieldT> lc;
    auto const nTerms = r.u32();
    for (std::uint32_t i = 0; i < nTerms; ++i)
    {
        auto const wire = r.u32();
        if (wire >= nWires)
            throw malformed("wire " + std::to_string(wire) + " out of range");

        FieldBytes coeff;
        std::memcpy(coeff.data(), r.take(coeff.size()), coeff.size());
        lc.add_term(libsnark::variable<FieldT>(wire), fieldFromLE(coeff));
    }
    return lc;
}

}  // namespace

R1CS
R1CS::parse(ripple::Blob const& data)
{
    Reader r(data.data(), data.size());

    auto const* magic = r.take(4);
    if (std::memcmp(magic, "r1cs", 4) != 0)
        throw malformed("bad magic");
    if (auto const version = r.u32(); version != 1)
        throw malformed("unsupported version " + std::to_string(version));

    std::optional<Section> headerSection;
    std::optional<Section> constraintSection;
    auto const nSections = r.u32();
    for (std::uint32_t i = 0; i < nSections; ++i)
    {
        auto const type = r.u32();
        auto const size = r.u64();
        if (size > r.remaining())
            throw malformed("section larger than file");

        Section const section{r.position(), static_cast<std::size_t>(size)};
        if (type == SECTION_HEADER)
            headerSection = section;
        else if (type == SECTION_CONSTRAINTS)
            constraintSection = section;
        r.take(section.size);
    }

    if (!headerSection)
        throw malformed("missing header section");
    if (!constraintSection)
        throw malformed("missing constraints section");

    R1CS result;
    auto& h = result.header_;
    {
        Reader hr(data.data() + headerSection->offset, headerSection->size);
        h.fieldSize = hr.u32();
        if (h.fieldSize != 32)
            throw malformed(
                "unsupported field size " + std::to_string(h.fieldSize));
        std::memcpy(h.prime.data(), hr.take(32), 32);
        h.nWires = hr.u32();
        h.nPubOut = hr.u32();
        h.nPubIn = hr.u32();
        h.nPrvIn = hr.u32();
        h.nLabels = hr.u64();
        h.nConstraints = hr.u32();
    }

    FieldBytes expectedPrime;
    {
        // p as little-endian bytes: p - 1 is encodable, then add one
        auto const pMinusOne = fieldToLE(-FieldT::one());
        expectedPrime = pMinusOne;
        for (auto& b : expectedPrime)
        {
            if (++b != 0)
                break;
        }
    }
    if (h.prime != expectedPrime)
        throw malformed("circuit is not over the BN254 scalar field");

    if (h.nWires == 0 || std::size_t(1) + result.numPublic() > h.nWires)
        throw malformed("inconsistent wire counts");

    auto& cs = result.constraints_;
    cs.primary_input_size = result.numPublic();
    cs.auxiliary_input_size = h.nWires - 1 - result.numPublic();

    Reader cr(data.data() + constraintSection->offset, constraintSection->size);
    for (std::uint32_t i = 0; i < h.nConstraints; ++i)
    {
        auto a = readLinearCombination(cr, h.nWires);
        auto b = readLinearCombination(cr, h.nWires);
        auto c = readLinearCombination(cr, h.nWires);
        cs.add_constraint(libsnark::r1cs_constraint<FieldT>(a, b, c));
    }
    if (cr.remaining() != 0)
        throw malformed("trailing bytes after constraints");

    return result;
}

}  // namespace zkp
}  // namespace novapool
