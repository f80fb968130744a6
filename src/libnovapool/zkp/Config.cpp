#include <libnovapool/zkp/Config.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>

#include <stdexcept>

namespace novapool {
namespace zkp {

namespace {

template <class T>
void
read(ripple::Section const& section, std::string const& key, T& target)
{
    auto const text = section.get<std::string>(key);
    if (!text)
        return;
    try
    {
        target = boost::lexical_cast<T>(*text);
    }
    catch (boost::bad_lexical_cast const&)
    {
        throw std::invalid_argument(
            "Invalid value '" + *text + "' for [" + section.name() + "] " +
            key);
    }
}

void
readFlag(ripple::Section const& section, std::string const& key, bool& target)
{
    auto const text = section.get<std::string>(key);
    if (!text)
        return;
    auto const value = boost::algorithm::to_lower_copy(*text);
    if (value == "true" || value == "1" || value == "yes")
        target = true;
    else if (value == "false" || value == "0" || value == "no")
        target = false;
    else
        throw std::invalid_argument(
            "Invalid flag '" + *text + "' for [" + section.name() + "] " +
            key);
}

void
readMillis(
    ripple::Section const& section,
    std::string const& key,
    std::chrono::milliseconds& target)
{
    std::uint64_t ms = target.count();
    read(section, key, ms);
    target = std::chrono::milliseconds(ms);
}

}  // namespace

PoolConfig
PoolConfig::fromSection(ripple::Section const& section)
{
    PoolConfig config;
    read(section, "levels", config.levels);
    read(section, "smt_levels", config.smtLevels);
    read(section, "membership_levels", config.membershipLevels);
    read(section, "root_history_size", config.rootHistorySize);

    read(section, "circuit_wasm_url", config.artifacts.circuitWasm);
    read(section, "proving_key_url", config.artifacts.provingKey);
    read(section, "r1cs_url", config.artifacts.r1cs);
    read(section, "artifact_cache_dir", config.artifactCacheDir);

    readMillis(section, "prove_timeout_ms", config.proveTimeout);
    readMillis(section, "call_timeout_ms", config.callTimeout);
    readMillis(section, "spawn_timeout_ms", config.spawnTimeout);
    read(section, "max_retries", config.maxRetries);

    read(section, "pool_contract", config.poolContract);
    read(section, "network_passphrase", config.networkPassphrase);
    read(section, "event_limit", config.eventLimit);
    readFlag(section, "encrypt_outputs", config.encryptOutputs);
    readFlag(section, "verify_hash_vectors", config.verifyHashVectors);

    config.validate();
    return config;
}

void
PoolConfig::validate() const
{
    auto checkDepth = [](std::size_t depth, char const* key) {
        if (depth == 0 || depth > 32)
            throw std::invalid_argument(
                std::string(key) + " must be between 1 and 32");
    };
    checkDepth(levels, "levels");
    checkDepth(membershipLevels, "membership_levels");
    if (smtLevels == 0 || smtLevels > 256)
        throw std::invalid_argument("smt_levels must be between 1 and 256");
    if (eventLimit == 0)
        throw std::invalid_argument("event_limit must be positive");
    if (rootHistorySize == 0)
        throw std::invalid_argument("root_history_size must be positive");
    if (proveTimeout.count() <= 0 || callTimeout.count() <= 0 ||
        spawnTimeout.count() <= 0)
        throw std::invalid_argument("timeouts must be positive");
}

}  // namespace zkp
}  // namespace novapool
