#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;
    using AESNonce = std::array<uint8_t, 12>;
    using AESTag = std::array<uint8_t, 16>;
    using HmacKey = std::array<uint8_t, 32>;
    using HmacTag = std::array<uint8_t, 32>;

    /** Ciphertext with its IV and authentication tag kept apart. */
    struct SealedBox
    {
        AESNonce iv{};
        Bytes ciphertext;
        AESTag tag{};
    };

    /**
     * AES-256-GCM encryption/decryption in detached mode
     */
    class AES256GCM
    {
    public:
        /** True when the CPU supports the libsodium AES-256-GCM implementation. */
        static bool is_available();

        /**
         * Encrypt plaintext under key with a fresh random IV.
         */
        static Result<SealedBox> encrypt(
            const AESKey &key,
            const Bytes &plaintext,
            const Bytes &associated_data = {});

        /**
         * Decrypt and authenticate. Fails closed on any tag mismatch.
         */
        static Result<Bytes> decrypt(
            const AESKey &key,
            const SealedBox &box,
            const Bytes &associated_data = {});
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(std::string_view data);
    };

    /**
     * HMAC-SHA-256 message authentication
     */
    class HmacSha256
    {
    public:
        static HmacTag sign(const HmacKey &key, std::string_view message);

        /** Constant-time verification of a tag. */
        static bool verify(const HmacKey &key, std::string_view message, const HmacTag &tag);
    };

    /**
     * Lowercase hexadecimal encoding
     */
    class Hex
    {
    public:
        static std::string encode(const uint8_t *data, size_t size);

        static std::string encode(const Bytes &data);

        template <size_t N>
        static std::string encode(const std::array<uint8_t, N> &data)
        {
            return encode(data.data(), data.size());
        }

        /** Decode hex; rejects odd length and non-hex characters. */
        static Result<Bytes> decode(std::string_view hex);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static void fill_bytes(Bytes &buffer);

        static Bytes generate_bytes(size_t n);

        /** Random RFC 4122 version 4 UUID string. */
        static std::string uuid_v4();
    };

    /**
     * Argon2id password hashing (libsodium pwhash_str format)
     */
    class PasswordHash
    {
    public:
        static Result<std::string> hash(std::string_view password);

        static bool verify(std::string_view password, const std::string &encoded);
    };

    /** Constant-time equality; unequal lengths compare false. */
    bool constant_time_equals(std::string_view a, std::string_view b);

    /** One-way derivation of a 32-byte key from a configured secret (SHA-256). */
    std::array<uint8_t, 32> derive_key(std::string_view secret);

} // namespace warden::crypto
