#pragma once

#include <libnovapool/zkp/Field.h>
#include <xrpl/basics/Blob.h>
#include <xrpl/json/json_value.h>
#include <memory>
#include <vector>

namespace novapool {
namespace zkp {

/**
 * Witness calculator compiled from the circuit.
 *
 * Takes the JSON circuit input (decimal strings) and returns the full
 * wire assignment, wire 0 first. Throws when the inputs violate a
 * circuit assertion.
 */
class WitnessCalculator
{
public:
    virtual ~WitnessCalculator() = default;

    virtual std::vector<FieldT>
    calculateWitness(Json::Value const& inputs) = 0;

    virtual std::size_t
    witnessSize() const = 0;
};

/** Instantiates a calculator from the circuit WASM bytes. */
class WitnessCalculatorFactory
{
public:
    virtual ~WitnessCalculatorFactory() = default;

    virtual std::unique_ptr<WitnessCalculator>
    create(ripple::Blob const& circuitWasm) = 0;
};

}  // namespace zkp
}  // namespace novapool
