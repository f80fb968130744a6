#include <libnovapool/zkp/ProverMessages.h>

#include <map>

namespace novapool {
namespace zkp {

namespace {

std::map<MessageType, char const*> const&
messageNames()
{
    static std::map<MessageType, char const*> const names{
        {MessageType::InitModules, "INIT_MODULES"},
        {MessageType::InitWitness, "INIT_WITNESS"},
        {MessageType::InitProver, "INIT_PROVER"},
        {MessageType::Prove, "PROVE"},
        {MessageType::Verify, "VERIFY"},
        {MessageType::GetVk, "GET_VK"},
        {MessageType::GetCircuitInfo, "GET_CIRCUIT_INFO"},
        {MessageType::Ping, "PING"},
        {MessageType::CheckCache, "CHECK_CACHE"},
        {MessageType::ClearCache, "CLEAR_CACHE"},
        {MessageType::Configure, "CONFIGURE"},
        {MessageType::GetState, "GET_STATE"},
        {MessageType::Progress, "PROGRESS"},
        {MessageType::Ready, "READY"}};
    return names;
}

}  // namespace

char const*
to_string(MessageType type)
{
    return messageNames().at(type);
}

std::optional<MessageType>
messageTypeFromString(std::string const& name)
{
    for (auto const& [type, text] : messageNames())
    {
        if (name == text)
            return type;
    }
    return std::nullopt;
}

bool
isIdempotent(MessageType type)
{
    switch (type)
    {
        case MessageType::Ping:
        case MessageType::CheckCache:
        case MessageType::GetVk:
        case MessageType::GetCircuitInfo:
            return true;
        default:
            return false;
    }
}

Json::Value
makeRequest(MessageType type, std::uint64_t messageId, Json::Value const& data)
{
    Json::Value request(Json::objectValue);
    request["type"] = to_string(type);
    request["messageId"] = std::to_string(messageId);
    request["data"] = data;
    return request;
}

Json::Value
makeSuccess(
    std::string const& type,
    std::uint64_t messageId,
    Json::Value const& result)
{
    Json::Value response(Json::objectValue);
    response["type"] = type;
    response["messageId"] = std::to_string(messageId);
    response["success"] = true;
    response["result"] = result;
    return response;
}

Json::Value
makeFailure(
    std::string const& type,
    std::uint64_t messageId,
    ErrorCode code,
    std::string const& error)
{
    Json::Value response(Json::objectValue);
    response["type"] = type;
    response["messageId"] = std::to_string(messageId);
    response["success"] = false;
    response["error"] = error;
    response["errorCode"] = to_string(code);
    return response;
}

}  // namespace zkp
}  // namespace novapool
