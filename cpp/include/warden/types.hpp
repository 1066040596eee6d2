#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * Error categories for warden operations.
     * The first group is the authorization taxonomy surfaced to callers;
     * the second group covers ambient failures (config, storage, crypto).
     */
    enum class ErrorCode
    {
        InvalidFormat,
        SignatureMismatch,
        DecryptionFailed,
        NotFound,
        Expired,
        Suspended,
        Revoked,
        Unauthenticated,
        Forbidden,
        Conflict,

        ConfigError,
        CryptoError,
        StorageError,
        InvalidInput,
        Cancelled,
        InternalError
    };

    /** Stable snake_case name of an error code (used in logs and HTTP bodies). */
    std::string_view error_code_name(ErrorCode code);

    /**
     * Warden error with code and message
     */
    class WardenError : public std::runtime_error
    {
    public:
        ErrorCode code;
        std::optional<std::string> reason;   // e.g. license validation reason
        std::optional<std::string> required; // unmet permission or privilege

        WardenError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        WardenError &with_reason(std::string r)
        {
            reason = std::move(r);
            return *this;
        }

        WardenError &with_required(std::string r)
        {
            required = std::move(r);
            return *this;
        }

        static WardenError invalid_format(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidFormat, msg);
        }

        static WardenError signature_mismatch(const std::string &msg)
        {
            return WardenError(ErrorCode::SignatureMismatch, msg);
        }

        static WardenError decryption_failed(const std::string &msg)
        {
            return WardenError(ErrorCode::DecryptionFailed, msg);
        }

        static WardenError not_found(const std::string &msg)
        {
            return WardenError(ErrorCode::NotFound, msg);
        }

        static WardenError unauthenticated(const std::string &msg)
        {
            return WardenError(ErrorCode::Unauthenticated, msg);
        }

        static WardenError forbidden(const std::string &msg)
        {
            return WardenError(ErrorCode::Forbidden, msg);
        }

        static WardenError conflict(const std::string &msg)
        {
            return WardenError(ErrorCode::Conflict, msg);
        }

        static WardenError config(const std::string &msg)
        {
            return WardenError(ErrorCode::ConfigError, msg);
        }

        static WardenError crypto(const std::string &msg)
        {
            return WardenError(ErrorCode::CryptoError, msg);
        }

        static WardenError storage(const std::string &msg)
        {
            return WardenError(ErrorCode::StorageError, msg);
        }

        static WardenError invalid_input(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidInput, msg);
        }

        static WardenError cancelled(const std::string &msg)
        {
            return WardenError(ErrorCode::Cancelled, msg);
        }

        static WardenError internal(const std::string &msg)
        {
            return WardenError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardenError>;

    /** Millisecond-precision wall clock timestamp. */
    using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

    inline Timestamp now_ms()
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    inline std::int64_t to_epoch_ms(Timestamp ts)
    {
        return ts.time_since_epoch().count();
    }

    inline Timestamp from_epoch_ms(std::int64_t ms)
    {
        return Timestamp{std::chrono::milliseconds{ms}};
    }

    /** RFC 3339 UTC rendering with milliseconds, e.g. 2026-01-02T03:04:05.678Z */
    std::string to_iso8601(Timestamp ts);

} // namespace warden
