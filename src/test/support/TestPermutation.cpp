#include <test/support/TestPermutation.h>

namespace novapool {
namespace test {

namespace {

constexpr std::size_t rounds = 8;

zkp::FieldT
roundConstant(std::size_t round, std::size_t width, std::size_t lane)
{
    auto const c = zkp::fieldFromU64(0x9e3779b97f4a7c15ULL);
    return c * zkp::fieldFromU64(round * 16 + width * 4 + lane + 1);
}

}  // namespace

std::vector<zkp::FieldT>
TestPermutation::permute(std::vector<zkp::FieldT> const& state) const
{
    auto s = state;
    auto const width = s.size();
    for (std::size_t r = 0; r < rounds; ++r)
    {
        for (std::size_t i = 0; i < width; ++i)
        {
            auto const x = s[i] + roundConstant(r, width, i);
            auto const x2 = x * x;
            s[i] = x2 * x2 * x;
        }

        auto sum = zkp::FieldT::zero();
        for (auto const& x : s)
            sum += x;
        for (auto& x : s)
            x += sum;
    }
    return s;
}

zkp::Poseidon2
testHasher()
{
    zkp::initCurve();
    return zkp::Poseidon2(std::make_shared<TestPermutation>());
}

}  // namespace test
}  // namespace novapool
