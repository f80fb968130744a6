#pragma once

#include <libnovapool/zkp/Field.h>
#include <libnovapool/zkp/R1CS.h>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>
#include <xrpl/basics/Blob.h>
#include <xrpl/beast/utility/Journal.h>
#include <memory>
#include <optional>
#include <vector>

namespace novapool {
namespace zkp {

using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>;
using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;
using Groth16Proof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;

constexpr std::size_t G1_SIZE = 64;
constexpr std::size_t G2_SIZE = 128;
constexpr std::size_t ONCHAIN_PROOF_SIZE = G1_SIZE + G2_SIZE + G1_SIZE;

// Structure to hold a proof in both encodings plus its public inputs
struct ProofData
{
    // libsnark stream encoding, used for local verification
    ripple::Blob compressed;
    // a (64) || b (128) || c (64), uncompressed big-endian
    ripple::Blob onChain;
    std::vector<FieldT> publicInputs;

    bool
    empty() const
    {
        return compressed.empty();
    }
};

/**
 * Groth16 prover over a circom circuit.
 *
 * Owns the proving key, verification key and R1CS. The proving key
 * artifact is the libsnark stream of the proving key followed by the
 * verification key.
 */
class ZkProver
{
public:
    explicit ZkProver(beast::Journal journal);

    /**
     * Load keys and constraint system.
     *
     * @throws PoolError(ProverFailure) if the artifacts are unreadable or
     *         the key was not generated for this R1CS.
     */
    void
    load(ripple::Blob const& provingKeyArtifact, ripple::Blob const& r1cs);

    bool
    isLoaded() const
    {
        return provingKey_ != nullptr;
    }

    std::size_t
    numPublic() const;

    std::size_t
    numConstraints() const;

    std::size_t
    numWires() const;

    /**
     * Prove from a full witness (wire 0 first).
     *
     * @throws PoolError(ProverFailure) if wire 0 is not one or the
     *         witness violates a constraint.
     */
    ProofData
    prove(std::vector<FieldT> const& witness) const;

    bool
    verify(
        ripple::Blob const& compressedProof,
        std::vector<FieldT> const& publicInputs) const;

    /**
     * Verifying key in the layout expected by the Soroban verifier:
     * alpha_g1 || beta_g2 || gamma_g2 || delta_g2 || n (u32 LE) || ic[n].
     */
    ripple::Blob
    sorobanVerifyingKey() const;

    static ripple::Blob
    serializeProof(Groth16Proof const& proof);

    static Groth16Proof
    deserializeProof(ripple::Blob const& data);

    static ripple::Blob
    onChainProof(Groth16Proof const& proof);

    static ripple::Blob
    serializeKeyArtifact(ProvingKey const& pk, VerificationKey const& vk);

    /** witness[1..=numPublic] */
    static std::vector<FieldT>
    extractPublicInputs(std::vector<FieldT> const& witness, std::size_t numPublic);

private:
    void
    requireLoaded() const;

    beast::Journal j_;
    std::shared_ptr<ProvingKey> provingKey_;
    std::shared_ptr<VerificationKey> verificationKey_;
    std::optional<R1CS> r1cs_;
};

/** Uncompressed G1 point: x || y, 32-byte big-endian each. */
ripple::Blob
encodeG1(libff::alt_bn128_G1 const& point);

/** Uncompressed G2 point: x.c1 || x.c0 || y.c1 || y.c0. */
ripple::Blob
encodeG2(libff::alt_bn128_G2 const& point);

}  // namespace zkp
}  // namespace novapool
