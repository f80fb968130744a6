#include <libnovapool/zkp/PoolError.h>

#include <array>
#include <cctype>
#include <utility>

namespace novapool {
namespace zkp {

namespace {

struct CodeName
{
    ErrorCode code;
    char const* name;
};

constexpr std::array<CodeName, 23> codeNames = {{
    {ErrorCode::Unbalanced, "Unbalanced"},
    {ErrorCode::FieldOverflow, "FieldOverflow"},
    {ErrorCode::InvalidHex, "InvalidHex"},
    {ErrorCode::InvalidAddress, "InvalidAddress"},
    {ErrorCode::InvalidCiphertext, "InvalidCiphertext"},
    {ErrorCode::MissingProof, "MissingProof"},
    {ErrorCode::TreeFull, "TreeFull"},
    {ErrorCode::IndexOutOfRange, "IndexOutOfRange"},
    {ErrorCode::DuplicateNullifier, "DuplicateNullifier"},
    {ErrorCode::InvalidInput, "InvalidInput"},
    {ErrorCode::MissingRecipientKey, "MissingRecipientKey"},
    {ErrorCode::Sanctioned, "Sanctioned"},
    {ErrorCode::NotRegistered, "NotRegistered"},
    {ErrorCode::RootMismatch, "RootMismatch"},
    {ErrorCode::SignerError, "SignerError"},
    {ErrorCode::UserRejected, "UserRejected"},
    {ErrorCode::ChainError, "ChainError"},
    {ErrorCode::NetworkError, "NetworkError"},
    {ErrorCode::ArtifactFetchError, "ArtifactFetchError"},
    {ErrorCode::WorkerTimeout, "WorkerTimeout"},
    {ErrorCode::WorkerNotReady, "WorkerNotReady"},
    {ErrorCode::UnknownMessageType, "UnknownMessageType"},
    {ErrorCode::ProverFailure, "ProverFailure"},
}};

}  // namespace

char const*
to_string(ErrorCode code)
{
    for (auto const& entry : codeNames)
    {
        if (entry.code == code)
            return entry.name;
    }
    return "Unknown";
}

std::optional<ErrorCode>
errorCodeFromString(std::string const& name)
{
    for (auto const& entry : codeNames)
    {
        if (name == entry.name)
            return entry.code;
    }
    return std::nullopt;
}

ErrorCategory
categoryOf(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::Sanctioned:
        case ErrorCode::NotRegistered:
        case ErrorCode::RootMismatch:
            return ErrorCategory::Compliance;
        case ErrorCode::SignerError:
        case ErrorCode::UserRejected:
        case ErrorCode::ChainError:
        case ErrorCode::NetworkError:
        case ErrorCode::ArtifactFetchError:
            return ErrorCategory::External;
        case ErrorCode::WorkerTimeout:
        case ErrorCode::WorkerNotReady:
        case ErrorCode::UnknownMessageType:
            return ErrorCategory::Protocol;
        case ErrorCode::ProverFailure:
            return ErrorCategory::Fatal;
        default:
            return ErrorCategory::InputValidation;
    }
}

PoolError::PoolError(
    ErrorCode code,
    std::string const& message,
    std::exception_ptr cause)
    : std::runtime_error(message), code_(code), cause_(std::move(cause))
{
}

std::optional<int>
PoolError::contractCode() const
{
    if (code_ != ErrorCode::ChainError)
        return std::nullopt;
    return parseContractErrorCode(what());
}

std::optional<int>
parseContractErrorCode(std::string const& message)
{
    auto const marker = message.find("Error(Contract, #");
    if (marker == std::string::npos)
        return std::nullopt;

    auto pos = marker + 17;
    if (pos >= message.size() ||
        !std::isdigit(static_cast<unsigned char>(message[pos])))
        return std::nullopt;

    int value = 0;
    while (pos < message.size() &&
           std::isdigit(static_cast<unsigned char>(message[pos])))
    {
        value = value * 10 + (message[pos] - '0');
        if (value > 1000000)
            return std::nullopt;
        ++pos;
    }
    return value;
}

}  // namespace zkp
}  // namespace novapool
