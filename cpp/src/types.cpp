#include "warden/types.hpp"
#include <format>

namespace warden
{

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::InvalidFormat:
            return "invalid_format";
        case ErrorCode::SignatureMismatch:
            return "signature_mismatch";
        case ErrorCode::DecryptionFailed:
            return "decryption_failed";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::Expired:
            return "expired";
        case ErrorCode::Suspended:
            return "suspended";
        case ErrorCode::Revoked:
            return "revoked";
        case ErrorCode::Unauthenticated:
            return "unauthenticated";
        case ErrorCode::Forbidden:
            return "forbidden";
        case ErrorCode::Conflict:
            return "conflict";
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    std::string to_iso8601(Timestamp ts)
    {
        return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ts);
    }

} // namespace warden
