#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace umpcore {

enum class ErrorKind {
    kTruncatedInput,
    kProtocolViolation,
    kUnknownHeaderId,
    kMissingCryptoParams,
    kInvalidKeyLength,
    kAuthenticationFailed,
    kDecompressionFailed,
    kUpstreamError,
    kCryptoFailure
};

std::string_view ErrorKindName(ErrorKind kind);

class UmpError : public std::runtime_error {
public:
    UmpError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace umpcore
