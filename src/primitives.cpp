#include "agentreg/primitives.hpp"
#include <format>
#include <algorithm>

namespace agentreg
{

    namespace
    {
        constexpr char kHexDigits[] = "0123456789abcdef";

        int nibble(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::string_view strip_prefix(std::string_view text)
        {
            if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
                return text.substr(2);
            return text;
        }

        template <std::size_t N>
        Result<std::array<uint8_t, N>> fixed_from_hex(std::string_view text, const char *what)
        {
            auto decoded = hex::decode(text);
            if (!decoded)
                return std::unexpected(decoded.error());
            if (decoded->size() != N)
            {
                return std::unexpected(RegistryError::invalid_input(
                    std::format("{} must be {} bytes", what, N)));
            }
            std::array<uint8_t, N> out{};
            std::copy(decoded->begin(), decoded->end(), out.begin());
            return out;
        }
    } // namespace

    namespace hex
    {
        std::string encode(const uint8_t *data, std::size_t size)
        {
            std::string out;
            out.reserve(size * 2);
            for (std::size_t i = 0; i < size; ++i)
            {
                out += kHexDigits[data[i] >> 4];
                out += kHexDigits[data[i] & 0x0f];
            }
            return out;
        }

        std::string encode(const Bytes &data)
        {
            return encode(data.data(), data.size());
        }

        Result<Bytes> decode(std::string_view text)
        {
            text = strip_prefix(text);
            if (text.size() % 2 != 0)
                return std::unexpected(RegistryError::invalid_input("Odd-length hex string"));

            Bytes out;
            out.reserve(text.size() / 2);
            for (std::size_t i = 0; i < text.size(); i += 2)
            {
                int hi = nibble(text[i]);
                int lo = nibble(text[i + 1]);
                if (hi < 0 || lo < 0)
                    return std::unexpected(RegistryError::invalid_input("Invalid hex character"));
                out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            }
            return out;
        }
    } // namespace hex

    Result<Address> Address::from_hex(std::string_view text)
    {
        auto raw = fixed_from_hex<kSize>(text, "address");
        if (!raw)
            return std::unexpected(raw.error());
        Address a;
        a.bytes = *raw;
        return a;
    }

    std::string Address::to_hex() const
    {
        return "0x" + hex::encode(bytes.data(), bytes.size());
    }

    bool Address::is_zero() const
    {
        return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    }

    Result<Hash32> Hash32::from_hex(std::string_view text)
    {
        auto raw = fixed_from_hex<kSize>(text, "hash");
        if (!raw)
            return std::unexpected(raw.error());
        Hash32 h;
        h.bytes = *raw;
        return h;
    }

    std::string Hash32::to_hex() const
    {
        return "0x" + hex::encode(bytes.data(), bytes.size());
    }

    bool Hash32::is_zero() const
    {
        return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    }

    std::string optional_hash_to_hex(const std::optional<Hash32> &hash)
    {
        return hash ? hash->to_hex() : std::string();
    }

} // namespace agentreg
