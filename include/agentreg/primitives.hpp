#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentreg
{

    using Bytes = std::vector<uint8_t>;
    using AgentId = uint64_t;
    using IncidentId = uint64_t;

    /**
     * 20-byte account address. The all-zero value is "no address" and is
     * rejected wherever an actor or recipient is required.
     */
    struct Address
    {
        static constexpr std::size_t kSize = 20;

        std::array<uint8_t, kSize> bytes{};

        static Address zero() { return Address{}; }

        /** Parse "0x" + 40 hex chars (prefix optional, case-insensitive) */
        static Result<Address> from_hex(std::string_view hex);

        /** Lower-case "0x"-prefixed hex */
        std::string to_hex() const;

        bool is_zero() const;

        friend bool operator==(const Address &, const Address &) = default;
        friend auto operator<=>(const Address &, const Address &) = default;
    };

    /**
     * 32-byte digest (content hashes, request identifiers)
     */
    struct Hash32
    {
        static constexpr std::size_t kSize = 32;

        std::array<uint8_t, kSize> bytes{};

        static Result<Hash32> from_hex(std::string_view hex);

        std::string to_hex() const;

        bool is_zero() const;

        friend bool operator==(const Hash32 &, const Hash32 &) = default;
        friend auto operator<=>(const Hash32 &, const Hash32 &) = default;
    };

    using RequestId = Hash32;

    /**
     * Caller identity and commit time of one operation. Supplied by the host
     * environment; the registries never read a clock of their own.
     */
    struct CallContext
    {
        Address sender;
        uint64_t timestamp{0};
    };

    namespace hex
    {
        std::string encode(const uint8_t *data, std::size_t size);
        std::string encode(const Bytes &data);

        /** Decode hex with optional "0x" prefix */
        Result<Bytes> decode(std::string_view text);
    } // namespace hex

    std::string optional_hash_to_hex(const std::optional<Hash32> &hash);

} // namespace agentreg

template <>
struct std::hash<agentreg::Address>
{
    std::size_t operator()(const agentreg::Address &a) const noexcept
    {
        std::size_t h = 1469598103934665603ull;
        for (uint8_t b : a.bytes)
        {
            h ^= b;
            h *= 1099511628211ull;
        }
        return h;
    }
};

template <>
struct std::hash<agentreg::Hash32>
{
    std::size_t operator()(const agentreg::Hash32 &d) const noexcept
    {
        // digests are uniformly distributed already
        std::size_t h = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i)
            h = (h << 8) | d.bytes[i];
        return h;
    }
};
