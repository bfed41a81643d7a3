#include "umpcore/errors.hpp"

namespace umpcore {

std::string_view ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kTruncatedInput:
            return "truncated_input";
        case ErrorKind::kProtocolViolation:
            return "protocol_violation";
        case ErrorKind::kUnknownHeaderId:
            return "unknown_header_id";
        case ErrorKind::kMissingCryptoParams:
            return "missing_crypto_params";
        case ErrorKind::kInvalidKeyLength:
            return "invalid_key_length";
        case ErrorKind::kAuthenticationFailed:
            return "authentication_failed";
        case ErrorKind::kDecompressionFailed:
            return "decompression_failed";
        case ErrorKind::kUpstreamError:
            return "upstream_error";
        case ErrorKind::kCryptoFailure:
            return "crypto_failure";
    }
    return "unknown";
}

UmpError::UmpError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

}  // namespace umpcore
