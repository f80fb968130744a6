#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace novapool {
namespace zkp {

/**
 * Failure codes raised by the transaction builder.
 *
 * The names double as the wire representation used by the prover
 * worker (see to_string / errorCodeFromString).
 */
enum class ErrorCode {
    // Input validation
    Unbalanced,
    FieldOverflow,
    InvalidHex,
    InvalidAddress,
    InvalidCiphertext,
    MissingProof,
    TreeFull,
    IndexOutOfRange,
    DuplicateNullifier,
    InvalidInput,
    MissingRecipientKey,
    // Compliance
    Sanctioned,
    NotRegistered,
    RootMismatch,
    // External
    SignerError,
    UserRejected,
    ChainError,
    NetworkError,
    ArtifactFetchError,
    // Protocol
    WorkerTimeout,
    WorkerNotReady,
    UnknownMessageType,
    // Fatal
    ProverFailure
};

enum class ErrorCategory {
    InputValidation,
    Compliance,
    External,
    Protocol,
    Fatal
};

char const*
to_string(ErrorCode code);

std::optional<ErrorCode>
errorCodeFromString(std::string const& name);

ErrorCategory
categoryOf(ErrorCode code);

/**
 * Exception carrying an ErrorCode and, for errors that wrap a failure
 * reported by an external collaborator, the original exception.
 */
class PoolError : public std::runtime_error
{
public:
    PoolError(
        ErrorCode code,
        std::string const& message,
        std::exception_ptr cause = nullptr);

    ErrorCode
    code() const noexcept
    {
        return code_;
    }

    ErrorCategory
    category() const noexcept
    {
        return categoryOf(code_);
    }

    std::exception_ptr
    cause() const noexcept
    {
        return cause_;
    }

    /** Numeric contract error (#0, #7, #8, #9...) when the chain reported one. */
    std::optional<int>
    contractCode() const;

private:
    ErrorCode code_;
    std::exception_ptr cause_;
};

/**
 * Extract N from a chain message of the form "Error(Contract, #N)".
 */
std::optional<int>
parseContractErrorCode(std::string const& message);

}  // namespace zkp
}  // namespace novapool
