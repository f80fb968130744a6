#pragma once

#include <xrpl/basics/BasicConfig.h>
#include <chrono>
#include <cstddef>
#include <string>

namespace novapool {
namespace zkp {

/** Input and output slots of the transaction circuit. */
constexpr std::size_t N_INS = 2;
constexpr std::size_t N_OUTS = 2;

constexpr char CONFIG_SECTION[] = "novapool";

struct ArtifactUrls
{
    std::string circuitWasm;
    std::string provingKey;
    std::string r1cs;
};

/**
 * Settings read from the [novapool] section, e.g.
 *
 *   [novapool]
 *   levels=5
 *   smt_levels=5
 *   proving_key_url=https://example.org/policy_tx_2_2.pk
 */
struct PoolConfig
{
    std::size_t levels = 5;
    std::size_t smtLevels = 5;
    std::size_t membershipLevels = 5;
    std::size_t rootHistorySize = 100;

    ArtifactUrls artifacts;
    std::string artifactCacheDir;

    std::chrono::milliseconds proveTimeout{120000};
    std::chrono::milliseconds callTimeout{60000};
    std::chrono::milliseconds spawnTimeout{10000};
    unsigned maxRetries = 1;

    std::string poolContract;
    std::string networkPassphrase;
    std::size_t eventLimit = 10000;
    bool encryptOutputs = true;
    bool verifyHashVectors = false;

    /** @throws std::invalid_argument on malformed or out-of-range values */
    static PoolConfig
    fromSection(ripple::Section const& section);

    void
    validate() const;
};

}  // namespace zkp
}  // namespace novapool
