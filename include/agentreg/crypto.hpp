#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <array>
#include <string>
#include <string_view>

namespace agentreg::crypto
{

    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;

    /**
     * Ed25519 key pair for signing and verification
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Derive key pair from seed bytes (32 bytes)
         */
        static Result<Ed25519KeyPair> from_seed(const std::array<uint8_t, 32> &seed);

        /**
         * Sign a message, returns 64-byte signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify signature against message. Non-canonical encodings of the
         * signature or the public key fail verification.
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        /**
         * Export to base64-encoded JSON
         */
        std::string to_json() const;

        /**
         * Import from base64-encoded JSON
         */
        static Result<Ed25519KeyPair> from_json(const std::string &json);
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static Hash32 hash(const Bytes &data);
        static Hash32 hash(std::string_view data);
    };

    /**
     * SHA-256 over a length-prefixed field encoding. Every field is
     * written as a one-byte tag, a big-endian u32 length and the raw bytes, so
     * distinct field sequences can never serialize to the same preimage.
     */
    class DigestBuilder
    {
    public:
        explicit DigestBuilder(std::string_view domain);

        DigestBuilder &add(const Address &address);
        DigestBuilder &add(const Hash32 &hash);
        DigestBuilder &add(uint64_t value);
        DigestBuilder &add(std::string_view text);

        Hash32 finish() const;

        const Bytes &preimage() const { return preimage_; }

    private:
        void write_field(uint8_t tag, const uint8_t *data, std::size_t size);

        Bytes preimage_;
    };

    /**
     * Base64 encoding/decoding (standard alphabet)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);
        static Result<Bytes> decode(const std::string &encoded);
    };

} // namespace agentreg::crypto
