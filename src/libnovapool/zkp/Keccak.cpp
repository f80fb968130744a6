#include <libnovapool/zkp/Keccak.h>

#include <cstring>

namespace novapool {
namespace zkp {

namespace {

constexpr std::uint64_t roundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

std::uint64_t
rotl(std::uint64_t x, std::size_t b)
{
    b %= 64;
    if (b == 0)
        return x;
    return (x << b) | (x >> (64 - b));
}

std::uint64_t
loadLE(std::uint8_t const* d)
{
    std::uint64_t r = 0;
    for (std::size_t i = 8; i-- > 0;)
        r = (r << 8) | d[i];
    return r;
}

void
storeLE(std::uint8_t* d, std::uint64_t n)
{
    for (std::size_t i = 0; i < 8; ++i)
        d[i] = static_cast<std::uint8_t>((n >> (8 * i)) & 0xFF);
}

}  // namespace

Keccak256::Keccak256() : used_(0)
{
    std::memset(state_, 0, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
}

void
Keccak256::permute(std::uint64_t A[5][5])
{
    for (std::size_t round = 0; round < 24; ++round)
    {
        // theta
        std::uint64_t C[5];
        for (std::size_t x = 0; x < 5; ++x)
            C[x] = A[x][0] ^ A[x][1] ^ A[x][2] ^ A[x][3] ^ A[x][4];
        for (std::size_t x = 0; x < 5; ++x)
        {
            std::uint64_t const D = C[(x + 4) % 5] ^ rotl(C[(x + 1) % 5], 1);
            for (std::size_t y = 0; y < 5; ++y)
                A[x][y] ^= D;
        }

        // rho, offsets are the triangular numbers along the (x, y) walk
        std::size_t x = 1, y = 0;
        for (std::size_t t = 0; t < 24; ++t)
        {
            A[x][y] = rotl(A[x][y], ((t + 1) * (t + 2) / 2) % 64);
            std::size_t const nx = y;
            std::size_t const ny = (2 * x + 3 * y) % 5;
            x = nx;
            y = ny;
        }

        // pi
        std::uint64_t B[5][5];
        for (std::size_t i = 0; i < 5; ++i)
            for (std::size_t j = 0; j < 5; ++j)
                B[i][j] = A[(i + 3 * j) % 5][i];

        // chi
        for (std::size_t i = 0; i < 5; ++i)
            for (std::size_t j = 0; j < 5; ++j)
                A[i][j] = B[i][j] ^ ((~B[(i + 1) % 5][j]) & B[(i + 2) % 5][j]);

        // iota
        A[0][0] ^= roundConstants[round];
    }
}

void
Keccak256::absorbBlock()
{
    for (std::size_t lane = 0; lane < rate_ / 8; ++lane)
        state_[lane % 5][lane / 5] ^= loadLE(buffer_ + 8 * lane);
    permute(state_);
    used_ = 0;
}

void
Keccak256::update(std::uint8_t const* data, std::size_t size)
{
    for (std::size_t i = 0; i < size; ++i)
    {
        buffer_[used_++] = data[i];
        if (used_ == rate_)
            absorbBlock();
    }
}

Keccak256Digest
Keccak256::finish()
{
    std::memset(buffer_ + used_, 0, rate_ - used_);
    buffer_[used_] ^= 0x01;
    buffer_[rate_ - 1] ^= 0x80;
    absorbBlock();

    Keccak256Digest digest;
    for (std::size_t lane = 0; lane < digest.size() / 8; ++lane)
        storeLE(digest.data() + 8 * lane, state_[lane % 5][lane / 5]);
    return digest;
}

Keccak256Digest
keccak256(std::uint8_t const* data, std::size_t size)
{
    Keccak256 hasher;
    hasher.update(data, size);
    return hasher.finish();
}

Keccak256Digest
keccak256(std::vector<std::uint8_t> const& data)
{
    return keccak256(data.data(), data.size());
}

}  // namespace zkp
}  // namespace novapool
