#pragma once

#include <libnovapool/zkp/PoolError.h>
#include <xrpl/json/json_value.h>
#include <cstdint>
#include <optional>
#include <string>

namespace novapool {
namespace zkp {

/**
 * Messages exchanged with the prover worker.
 *
 * Requests:   { "type", "messageId", "data" }
 * Responses:  { "type", "messageId", "success", "result" }
 *          or { "type", "messageId", "success": false, "error", "errorCode" }
 * Progress:   { "type": "PROGRESS", "messageId", "loaded", "total",
 *               "percent", "message" }
 * The worker announces itself with { "type": "READY" } once started.
 */
enum class MessageType {
    InitModules,
    InitWitness,
    InitProver,
    Prove,
    Verify,
    GetVk,
    GetCircuitInfo,
    Ping,
    CheckCache,
    ClearCache,
    Configure,
    GetState,
    // worker to client only
    Progress,
    Ready
};

char const*
to_string(MessageType type);

std::optional<MessageType>
messageTypeFromString(std::string const& name);

/** Safe to resend after a timeout. */
bool
isIdempotent(MessageType type);

Json::Value
makeRequest(MessageType type, std::uint64_t messageId, Json::Value const& data);

Json::Value
makeSuccess(std::string const& type, std::uint64_t messageId, Json::Value const& result);

Json::Value
makeFailure(
    std::string const& type,
    std::uint64_t messageId,
    ErrorCode code,
    std::string const& error);

}  // namespace zkp
}  // namespace novapool
