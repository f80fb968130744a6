#include <libnovapool/zkp/ZKProver.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>

#include <sstream>
#include <string>

namespace novapool {
namespace zkp {

namespace {

template <mp_size_t N>
void
appendBigintBE(ripple::Blob& out, libff::bigint<N> const& value)
{
    std::size_t const limbBytes = sizeof(value.data[0]);
    for (std::size_t i = 32; i-- > 0;)
    {
        std::size_t const limb = i / limbBytes;
        std::size_t const shift = 8 * (i % limbBytes);
        out.push_back(
            limb < N ? static_cast<std::uint8_t>((value.data[limb] >> shift) & 0xFF)
                     : 0);
    }
}

void
appendG1(ripple::Blob& out, libff::alt_bn128_G1 const& point)
{
    if (point.is_zero())
    {
        out.insert(out.end(), G1_SIZE, 0);
        return;
    }
    auto affine = point;
    affine.to_affine_coordinates();
    appendBigintBE(out, affine.X.as_bigint());
    appendBigintBE(out, affine.Y.as_bigint());
}

void
appendG2(ripple::Blob& out, libff::alt_bn128_G2 const& point)
{
    if (point.is_zero())
    {
        out.insert(out.end(), G2_SIZE, 0);
        return;
    }
    auto affine = point;
    affine.to_affine_coordinates();
    appendBigintBE(out, affine.X.c1.as_bigint());
    appendBigintBE(out, affine.X.c0.as_bigint());
    appendBigintBE(out, affine.Y.c1.as_bigint());
    appendBigintBE(out, affine.Y.c0.as_bigint());
}

PoolError
proverFailure(std::string const& what)
{
    return PoolError(ErrorCode::ProverFailure, what);
}

}  // namespace

ripple::Blob
encodeG1(libff::alt_bn128_G1 const& point)
{
    ripple::Blob out;
    out.reserve(G1_SIZE);
    appendG1(out, point);
    return out;
}

ripple::Blob
encodeG2(libff::alt_bn128_G2 const& point)
{
    ripple::Blob out;
    out.reserve(G2_SIZE);
    appendG2(out, point);
    return out;
}

ZkProver::ZkProver(beast::Journal journal) : j_(journal)
{
    initCurve();
}

void
ZkProver::load(ripple::Blob const& provingKeyArtifact, ripple::Blob const& r1csBytes)
{
    auto r1cs = R1CS::parse(r1csBytes);

    auto pk = std::make_shared<ProvingKey>();
    auto vk = std::make_shared<VerificationKey>();
    {
        std::stringstream ss(
            std::string(provingKeyArtifact.begin(), provingKeyArtifact.end()));
        ss >> *pk;
        ss >> *vk;
        if (ss.fail())
            throw proverFailure("Proving key artifact is truncated or corrupt");
    }

    auto const& keyCs = pk->constraint_system;
    JLOG(j_.debug()) << "Loaded keys with " << keyCs.num_constraints()
                     << " constraints, R1CS has " << r1cs.numConstraints();

    if (keyCs.num_constraints() != r1cs.numConstraints())
        throw proverFailure(
            "Proving key has " + std::to_string(keyCs.num_constraints()) +
            " constraints but the circuit has " +
            std::to_string(r1cs.numConstraints()));

    if (keyCs.num_inputs() != r1cs.numPublic() ||
        vk->gamma_ABC_g1.domain_size() != r1cs.numPublic())
        throw proverFailure(
            "Proving key has " + std::to_string(keyCs.num_inputs()) +
            " public inputs but the circuit has " +
            std::to_string(r1cs.numPublic()));

    provingKey_ = std::move(pk);
    verificationKey_ = std::move(vk);
    r1cs_ = std::move(r1cs);
}

void
ZkProver::requireLoaded() const
{
    if (!isLoaded())
        throw PoolError(ErrorCode::WorkerNotReady, "Prover keys not loaded");
}

std::size_t
ZkProver::numPublic() const
{
    requireLoaded();
    return r1cs_->numPublic();
}

std::size_t
ZkProver::numConstraints() const
{
    requireLoaded();
    return r1cs_->numConstraints();
}

std::size_t
ZkProver::numWires() const
{
    requireLoaded();
    return r1cs_->numWires();
}

std::vector<FieldT>
ZkProver::extractPublicInputs(
    std::vector<FieldT> const& witness,
    std::size_t numPublic)
{
    if (witness.size() < numPublic + 1)
        throw proverFailure("Witness shorter than its public inputs");
    return std::vector<FieldT>(
        witness.begin() + 1, witness.begin() + 1 + numPublic);
}

ProofData
ZkProver::prove(std::vector<FieldT> const& witness) const
{
    requireLoaded();

    if (witness.size() != r1cs_->numWires())
        throw proverFailure(
            "Witness has " + std::to_string(witness.size()) +
            " wires, circuit expects " + std::to_string(r1cs_->numWires()));
    if (witness[0] != FieldT::one())
        throw proverFailure("Witness wire 0 must be one");

    auto const nPublic = r1cs_->numPublic();
    libsnark::r1cs_primary_input<FieldT> primary =
        extractPublicInputs(witness, nPublic);
    libsnark::r1cs_auxiliary_input<FieldT> auxiliary(
        witness.begin() + 1 + nPublic, witness.end());

    if (!provingKey_->constraint_system.is_satisfied(primary, auxiliary))
        throw proverFailure("Witness does not satisfy the circuit constraints");

    JLOG(j_.debug()) << "Generating Groth16 proof over "
                     << r1cs_->numConstraints() << " constraints";
    auto const proof = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
        *provingKey_, primary, auxiliary);

    ProofData result;
    result.compressed = serializeProof(proof);
    result.onChain = onChainProof(proof);
    result.publicInputs = std::move(primary);
    return result;
}

bool
ZkProver::verify(
    ripple::Blob const& compressedProof,
    std::vector<FieldT> const& publicInputs) const
{
    requireLoaded();

    if (compressedProof.empty())
    {
        JLOG(j_.warn()) << "Error verifying proof: empty proof data";
        return false;
    }
    if (publicInputs.size() != r1cs_->numPublic())
    {
        JLOG(j_.warn()) << "Error verifying proof: expected "
                        << r1cs_->numPublic() << " public inputs, got "
                        << publicInputs.size();
        return false;
    }

    Groth16Proof proof;
    try
    {
        proof = deserializeProof(compressedProof);
    }
    catch (PoolError const& e)
    {
        JLOG(j_.warn()) << "Error verifying proof: " << e.what();
        return false;
    }

    bool const ok = libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
        *verificationKey_, publicInputs, proof);
    JLOG(j_.debug()) << "Verification result: " << (ok ? "PASS" : "FAIL");
    return ok;
}

ripple::Blob
ZkProver::sorobanVerifyingKey() const
{
    requireLoaded();

    auto const& ic = verificationKey_->gamma_ABC_g1;
    std::uint32_t const icCount =
        static_cast<std::uint32_t>(1 + ic.rest.domain_size());

    ripple::Blob out;
    out.reserve(G1_SIZE + 3 * G2_SIZE + 4 + icCount * G1_SIZE);
    appendG1(out, provingKey_->alpha_g1);
    appendG2(out, provingKey_->beta_g2);
    appendG2(out, verificationKey_->gamma_g2);
    appendG2(out, verificationKey_->delta_g2);
    for (int shift = 0; shift < 32; shift += 8)
        out.push_back(static_cast<std::uint8_t>((icCount >> shift) & 0xFF));

    appendG1(out, ic.first);
    for (std::size_t i = 0; i < ic.rest.domain_size(); ++i)
        appendG1(out, ic.rest[i]);
    return out;
}

ripple::Blob
ZkProver::serializeProof(Groth16Proof const& proof)
{
    std::ostringstream oss;
    oss << proof;

    std::string const str = oss.str();
    return ripple::Blob(str.begin(), str.end());
}

Groth16Proof
ZkProver::deserializeProof(ripple::Blob const& data)
{
    std::istringstream iss(std::string(data.begin(), data.end()));

    Groth16Proof proof;
    iss >> proof;
    if (iss.fail())
        throw proverFailure("Malformed proof encoding");
    if (!proof.is_well_formed())
        throw proverFailure("Proof points are not on the curve");
    return proof;
}

ripple::Blob
ZkProver::onChainProof(Groth16Proof const& proof)
{
    ripple::Blob out;
    out.reserve(ONCHAIN_PROOF_SIZE);
    appendG1(out, proof.g_A);
    appendG2(out, proof.g_B);
    appendG1(out, proof.g_C);
    return out;
}

ripple::Blob
ZkProver::serializeKeyArtifact(ProvingKey const& pk, VerificationKey const& vk)
{
    std::ostringstream oss;
    oss << pk;
    oss << vk;

    std::string const str = oss.str();
    return ripple::Blob(str.begin(), str.end());
}

}  // namespace zkp
}  // namespace novapool
