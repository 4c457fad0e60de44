#include "agentreg/crypto.hpp"
#include <format>
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>

using json = nlohmann::json;

namespace agentreg::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // Ed25519KeyPair Implementation
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(RegistryError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const std::array<uint8_t, 32> &seed)
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(RegistryError::crypto("Failed to derive Ed25519 keypair from seed"));
        }

        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        unsigned long long sig_len;

        crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());

        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        // libsodium rejects S >= L and small-order / non-canonical points
        return crypto_sign_verify_detached(
                   signature.data(),
                   message.data(),
                   message.size(),
                   public_key.data()) == 0;
    }

    std::string Ed25519KeyPair::to_json() const
    {
        json j = {
            {"public_key", Base64::encode(Bytes(public_key.begin(), public_key.end()))},
            {"secret_key", Base64::encode(Bytes(secret_key.begin(), secret_key.end()))}};
        return j.dump(2);
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_json(const std::string &json_str)
    {
        try
        {
            auto j = json::parse(json_str);

            auto pub_result = Base64::decode(j.at("public_key").get<std::string>());
            if (!pub_result)
                return std::unexpected(pub_result.error());

            auto sec_result = Base64::decode(j.at("secret_key").get<std::string>());
            if (!sec_result)
                return std::unexpected(sec_result.error());

            if (pub_result->size() != 32)
            {
                return std::unexpected(RegistryError::crypto("Invalid public key length"));
            }
            if (sec_result->size() != 64)
            {
                return std::unexpected(RegistryError::crypto("Invalid secret key length"));
            }

            // the first half of a libsodium secret key is its seed
            std::array<uint8_t, 32> seed;
            std::copy_n(sec_result->begin(), 32, seed.begin());
            auto keypair = from_seed(seed);
            if (!keypair)
                return std::unexpected(keypair.error());

            if (!std::equal(pub_result->begin(), pub_result->end(), keypair->public_key.begin()))
            {
                return std::unexpected(RegistryError::crypto("Public key does not match secret key"));
            }
            return keypair;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(RegistryError::parsing(
                std::format("Failed to parse keypair JSON: {}", e.what())));
        }
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    Hash32 SHA256::hash(const Bytes &data)
    {
        Hash32 output;
        crypto_hash_sha256(output.bytes.data(), data.data(), data.size());
        return output;
    }

    Hash32 SHA256::hash(std::string_view data)
    {
        Hash32 output;
        crypto_hash_sha256(output.bytes.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    // ============================================================================
    // DigestBuilder Implementation
    // ============================================================================

    namespace
    {
        enum FieldTag : uint8_t
        {
            kDomainField = 0x01,
            kAddressField = 0x02,
            kHashField = 0x03,
            kIntegerField = 0x04,
            kTextField = 0x05
        };
    } // namespace

    DigestBuilder::DigestBuilder(std::string_view domain)
    {
        write_field(kDomainField, reinterpret_cast<const uint8_t *>(domain.data()), domain.size());
    }

    DigestBuilder &DigestBuilder::add(const Address &address)
    {
        write_field(kAddressField, address.bytes.data(), address.bytes.size());
        return *this;
    }

    DigestBuilder &DigestBuilder::add(const Hash32 &hash)
    {
        write_field(kHashField, hash.bytes.data(), hash.bytes.size());
        return *this;
    }

    DigestBuilder &DigestBuilder::add(uint64_t value)
    {
        std::array<uint8_t, 8> be{};
        for (int i = 7; i >= 0; --i)
        {
            be[static_cast<std::size_t>(i)] = static_cast<uint8_t>(value & 0xff);
            value >>= 8;
        }
        write_field(kIntegerField, be.data(), be.size());
        return *this;
    }

    DigestBuilder &DigestBuilder::add(std::string_view text)
    {
        write_field(kTextField, reinterpret_cast<const uint8_t *>(text.data()), text.size());
        return *this;
    }

    Hash32 DigestBuilder::finish() const
    {
        return SHA256::hash(preimage_);
    }

    void DigestBuilder::write_field(uint8_t tag, const uint8_t *data, std::size_t size)
    {
        auto len = static_cast<uint32_t>(size);
        preimage_.push_back(tag);
        preimage_.push_back(static_cast<uint8_t>(len >> 24));
        preimage_.push_back(static_cast<uint8_t>(len >> 16));
        preimage_.push_back(static_cast<uint8_t>(len >> 8));
        preimage_.push_back(static_cast<uint8_t>(len));
        preimage_.insert(preimage_.end(), data, data + size);
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(RegistryError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

} // namespace agentreg::crypto
