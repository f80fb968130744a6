#include <test/support/BalanceCircuit.h>
#include <test/support/TestPermutation.h>

#include <libnovapool/zkp/ArtifactProvider.h>
#include <libnovapool/zkp/R1CS.h>
#include <libnovapool/zkp/ZKProver.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace novapool {
namespace test {

using namespace zkp;

namespace {

constexpr char wasmMagic[] = "balance-circuit-wasm-v1";

enum Wire : std::uint32_t {
    one = 0,
    root = 1,
    publicAmount = 2,
    extDataHash = 3,
    inputNullifier = 4,
    outputCommitment = 6,
    membershipRoots = 8,
    nonMembershipRoots = 10,
    inAmount = 12,
    outAmount = 14,
};

using Term = std::pair<std::uint32_t, FieldT>;
using LinearCombination = std::vector<Term>;

struct Constraint
{
    LinearCombination a;
    LinearCombination b;
    LinearCombination c;
};

class Writer
{
public:
    void
    u32(std::uint32_t v)
    {
        for (int i = 0; i < 4; ++i)
            out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
    }

    void
    u64(std::uint64_t v)
    {
        u32(static_cast<std::uint32_t>(v));
        u32(static_cast<std::uint32_t>(v >> 32));
    }

    void
    bytes(std::uint8_t const* data, std::size_t size)
    {
        out.insert(out.end(), data, data + size);
    }

    void
    lc(LinearCombination const& terms)
    {
        u32(static_cast<std::uint32_t>(terms.size()));
        for (auto const& [wire, coeff] : terms)
        {
            u32(wire);
            auto const le = fieldToLE(coeff);
            bytes(le.data(), le.size());
        }
    }

    ripple::Blob out;
};

FieldBytes
primeLE()
{
    auto p = fieldToLE(-FieldT::one());
    for (auto& b : p)
    {
        if (++b != 0)
            break;
    }
    return p;
}

ripple::Blob
writeR1cs(std::vector<Constraint> const& constraints)
{
    Writer header;
    header.u32(32);
    auto const prime = primeLE();
    header.bytes(prime.data(), prime.size());
    header.u32(balance_circuit::numWires);
    header.u32(0);
    header.u32(balance_circuit::numPublic);
    header.u32(balance_circuit::numWires - 1 - balance_circuit::numPublic);
    header.u64(balance_circuit::numWires);
    header.u32(static_cast<std::uint32_t>(constraints.size()));

    Writer body;
    for (auto const& c : constraints)
    {
        body.lc(c.a);
        body.lc(c.b);
        body.lc(c.c);
    }

    Writer file;
    file.bytes(reinterpret_cast<std::uint8_t const*>("r1cs"), 4);
    file.u32(1);
    file.u32(2);
    file.u32(1);
    file.u64(header.out.size());
    file.bytes(header.out.data(), header.out.size());
    file.u32(2);
    file.u64(body.out.size());
    file.bytes(body.out.data(), body.out.size());
    return file.out;
}

Constraint
balanceConstraint()
{
    auto const plus = FieldT::one();
    auto const minus = -FieldT::one();
    return Constraint{
        {{inAmount, plus},
         {inAmount + 1, plus},
         {publicAmount, plus},
         {outAmount, minus},
         {outAmount + 1, minus}},
        {{one, plus}},
        {}};
}

Json::Value const&
member(Json::Value const& inputs, char const* key)
{
    if (!inputs.isObject() || !inputs.isMember(key))
        throw std::runtime_error(std::string("Missing input signal ") + key);
    return inputs[key];
}

FieldT
signal(Json::Value const& value)
{
    if (!value.isString())
        throw std::runtime_error("Input signals must be decimal strings");
    return fieldFromDecimal(value.asString());
}

FieldT
element(Json::Value const& inputs, char const* key, Json::ArrayIndex i)
{
    auto const& array = member(inputs, key);
    if (!array.isArray() || array.size() <= i)
        throw std::runtime_error(std::string("Input signal ") + key + " is too short");
    auto const& v = array[i];
    // Nested signals (membershipRoots[i][0]) are flattened
    return signal(v.isArray() ? v[0u] : v);
}

FieldT
rangeChecked(Json::Value const& inputs, char const* key, Json::ArrayIndex i)
{
    auto const& array = member(inputs, key);
    if (!array.isArray() || array.size() <= i || !array[i].isString())
        throw std::runtime_error(std::string("Input signal ") + key + " is malformed");
    Amount const amount(array[i].asString().c_str());
    if (amount < 0 || amount >= maxNoteAmount())
        throw std::runtime_error(
            std::string("Assert Failed. Num2Bits(248) on ") + key);
    return fieldFromAmount(amount);
}

}  // namespace

ripple::Blob
balanceCircuitR1cs()
{
    return writeR1cs({balanceConstraint()});
}

ripple::Blob
extendedCircuitR1cs()
{
    Constraint square{
        {{outAmount, FieldT::one()}},
        {{outAmount, FieldT::one()}},
        {{outAmount, FieldT::one()}}};
    return writeR1cs({balanceConstraint(), square});
}

ripple::Blob const&
balanceCircuitKeys()
{
    static ripple::Blob const keys = [] {
        initCurve();
        auto const r1cs = R1CS::parse(balanceCircuitR1cs());
        auto const keypair =
            libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(
                r1cs.constraintSystem());
        return ZkProver::serializeKeyArtifact(keypair.pk, keypair.vk);
    }();
    return keys;
}

Json::Value
balanceCircuitInputs(
    std::uint64_t in0,
    std::uint64_t in1,
    std::uint64_t publicAmount,
    std::uint64_t out0,
    std::uint64_t out1)
{
    auto pair = [](std::string const& a, std::string const& b) {
        Json::Value array(Json::arrayValue);
        array.append(a);
        array.append(b);
        return array;
    };
    auto nested = [](std::string const& value) {
        Json::Value inner(Json::arrayValue);
        inner.append(value);
        Json::Value array(Json::arrayValue);
        array.append(inner);
        array.append(inner);
        return array;
    };

    Json::Value inputs(Json::objectValue);
    inputs["root"] = "1001";
    inputs["publicAmount"] = std::to_string(publicAmount);
    inputs["extDataHash"] = "1002";
    inputs["inputNullifier"] = pair("1003", "1004");
    inputs["outputCommitment"] = pair("1005", "1006");
    inputs["membershipRoots"] = nested("1007");
    inputs["nonMembershipRoots"] = nested("0");
    inputs["inAmount"] = pair(std::to_string(in0), std::to_string(in1));
    inputs["outAmount"] = pair(std::to_string(out0), std::to_string(out1));
    return inputs;
}

ripple::Blob
balanceCircuitWasm()
{
    return ripple::Blob(wasmMagic, wasmMagic + sizeof(wasmMagic) - 1);
}

std::vector<FieldT>
BalanceWitnessCalculator::calculateWitness(Json::Value const& inputs)
{
    if (delay_.count() > 0)
        std::this_thread::sleep_for(delay_);

    std::vector<FieldT> w(balance_circuit::numWires, FieldT::zero());
    w[one] = FieldT::one();
    w[root] = signal(member(inputs, "root"));
    w[publicAmount] = signal(member(inputs, "publicAmount"));
    w[extDataHash] = signal(member(inputs, "extDataHash"));
    for (Json::ArrayIndex i = 0; i < 2; ++i)
    {
        w[inputNullifier + i] = element(inputs, "inputNullifier", i);
        w[outputCommitment + i] = element(inputs, "outputCommitment", i);
        w[membershipRoots + i] = element(inputs, "membershipRoots", i);
        w[nonMembershipRoots + i] = element(inputs, "nonMembershipRoots", i);
        w[inAmount + i] = rangeChecked(inputs, "inAmount", i);
        w[outAmount + i] = rangeChecked(inputs, "outAmount", i);
    }

    if (w[inAmount] + w[inAmount + 1] + w[publicAmount] !=
        w[outAmount] + w[outAmount + 1])
        throw std::runtime_error("Assert Failed. Error in template Transaction");
    return w;
}

std::unique_ptr<WitnessCalculator>
BalanceWitnessCalculatorFactory::create(ripple::Blob const& circuitWasm)
{
    if (circuitWasm != balanceCircuitWasm())
        throw std::runtime_error("Invalid WASM module");
    ++created;
    return std::make_unique<BalanceWitnessCalculator>(delay);
}

std::shared_ptr<MemoryArtifactSource>
balanceCircuitSource()
{
    auto source = std::make_shared<MemoryArtifactSource>();
    source->add(balance_circuit::wasmUrl, balanceCircuitWasm());
    source->add(balance_circuit::provingKeyUrl, balanceCircuitKeys());
    source->add(balance_circuit::r1csUrl, balanceCircuitR1cs());
    return source;
}

PoolConfig
balanceCircuitConfig()
{
    PoolConfig config;
    config.artifacts.circuitWasm = balance_circuit::wasmUrl;
    config.artifacts.provingKey = balance_circuit::provingKeyUrl;
    config.artifacts.r1cs = balance_circuit::r1csUrl;
    config.poolContract =
        "CAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAABSC4";
    config.networkPassphrase = "Test SDF Network ; September 2015";
    config.verifyHashVectors = false;
    return config;
}

std::unique_ptr<ProverWorker>
makeBalanceWorker(
    PoolConfig const& config,
    std::shared_ptr<MemoryArtifactSource> source,
    std::shared_ptr<BalanceWitnessCalculatorFactory> factory,
    beast::Journal journal)
{
    auto artifacts = std::make_shared<CachingArtifactProvider>(
        std::move(source), config.artifactCacheDir, journal);
    return std::make_unique<ProverWorker>(
        std::move(artifacts), std::move(factory), testHasher(), config, journal);
}

}  // namespace test
}  // namespace novapool
