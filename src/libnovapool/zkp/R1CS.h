#pragma once

#include <libnovapool/zkp/Field.h>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>
#include <xrpl/basics/Blob.h>
#include <cstdint>

namespace novapool {
namespace zkp {

struct R1csHeader
{
    std::uint32_t fieldSize = 0;
    FieldBytes prime{};
    std::uint32_t nWires = 0;
    std::uint32_t nPubOut = 0;
    std::uint32_t nPubIn = 0;
    std::uint32_t nPrvIn = 0;
    std::uint64_t nLabels = 0;
    std::uint32_t nConstraints = 0;
};

/**
 * Constraint system of a compiled circom circuit.
 *
 * Wire 0 is the constant one, wires 1..numPublic() are the public
 * outputs followed by the public inputs, and the rest are private.
 * This matches libsnark's variable numbering, so wires map directly
 * onto variable indices.
 */
class R1CS
{
public:
    /**
     * Parse the circom binary format ("r1cs", version 1).
     *
     * @throws PoolError(ProverFailure) on a malformed file or a field
     *         other than BN254's scalar field.
     */
    static R1CS
    parse(ripple::Blob const& data);

    R1csHeader const&
    header() const
    {
        return header_;
    }

    std::size_t
    numPublic() const
    {
        return header_.nPubOut + header_.nPubIn;
    }

    std::size_t
    numWires() const
    {
        return header_.nWires;
    }

    std::size_t
    numConstraints() const
    {
        return constraints_.num_constraints();
    }

    libsnark::r1cs_constraint_system<FieldT> const&
    constraintSystem() const
    {
        return constraints_;
    }

private:
    R1csHeader header_;
    libsnark::r1cs_constraint_system<FieldT> constraints_;
};

}  // namespace zkp
}  // namespace novapool
