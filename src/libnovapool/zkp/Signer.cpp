#include <libnovapool/zkp/Signer.h>

#include <regex>

namespace novapool {
namespace zkp {

PoolError
walletError(std::string const& message, std::exception_ptr cause)
{
    static std::regex const rejected(
        "reject|declin|denied|cancel", std::regex::icase);

    auto const text = message.empty() ? std::string("Wallet error") : message;
    auto const code = std::regex_search(text, rejected)
        ? ErrorCode::UserRejected
        : ErrorCode::SignerError;
    return PoolError(code, text, cause);
}

}  // namespace zkp
}  // namespace novapool
