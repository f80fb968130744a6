#include <test/support/FakeSigner.h>

#include <xrpl/basics/base64.h>

#include <openssl/sha.h>

#include <stdexcept>
#include <utility>

namespace novapool {
namespace test {

namespace {

void
digest(std::string const& data, std::uint8_t* out)
{
    SHA256(reinterpret_cast<unsigned char const*>(data.data()), data.size(), out);
}

}  // namespace

FakeSigner::FakeSigner(std::string seed, std::string address)
    : seed_(std::move(seed)), address_(std::move(address))
{
}

void
FakeSigner::check() const
{
    if (decline)
        throw std::runtime_error("User declined the request");
    if (broken)
        throw std::runtime_error("Wallet connection lost");
}

ripple::Blob
FakeSigner::signMessage(std::string const& message)
{
    check();
    messages.push_back(message);

    auto const body = constant ? std::string("constant") : message;
    ripple::Blob sig(64);
    digest(seed_ + "|" + body, sig.data());
    digest(body + "|" + seed_, sig.data() + 32);
    return sig;
}

zkp::SignedTransaction
FakeSigner::signTransaction(std::string const& xdr, zkp::SignOptions const&)
{
    check();
    return {ripple::base64_encode(seed_ + ":" + xdr), address_};
}

zkp::SignedAuthEntry
FakeSigner::signAuthEntry(std::string const& xdr, zkp::SignOptions const&)
{
    check();
    return {ripple::base64_encode(seed_ + ":" + xdr), address_};
}

std::string
FakeSigner::getAddress()
{
    check();
    return address_;
}

}  // namespace test
}  // namespace novapool
