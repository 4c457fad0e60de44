#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace agentreg::checks
{
    // Shared input guards. Each returns the error the registries propagate.

    inline Result<void> max_length(std::string_view field, std::string_view value, std::size_t max)
    {
        if (value.size() > max)
            return std::unexpected(RegistryError::too_long(std::string(field), max));
        return {};
    }

    /** Strict UTF-8: no overlong forms, surrogates or code points past U+10FFFF */
    inline bool is_utf8(std::string_view value)
    {
        std::size_t i = 0;
        while (i < value.size())
        {
            const auto lead = static_cast<unsigned char>(value[i]);
            std::size_t extra = 0;
            uint32_t cp = 0;
            uint32_t min = 0;
            if (lead < 0x80)
            {
                ++i;
                continue;
            }
            if ((lead & 0xe0) == 0xc0)
            {
                extra = 1;
                cp = lead & 0x1f;
                min = 0x80;
            }
            else if ((lead & 0xf0) == 0xe0)
            {
                extra = 2;
                cp = lead & 0x0f;
                min = 0x800;
            }
            else if ((lead & 0xf8) == 0xf0)
            {
                extra = 3;
                cp = lead & 0x07;
                min = 0x10000;
            }
            else
            {
                return false;
            }
            if (value.size() - i <= extra)
                return false;
            for (std::size_t k = 1; k <= extra; ++k)
            {
                const auto cont = static_cast<unsigned char>(value[i + k]);
                if ((cont & 0xc0) != 0x80)
                    return false;
                cp = (cp << 6) | (cont & 0x3f);
            }
            if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
                return false;
            i += extra + 1;
        }
        return true;
    }

    inline Result<void> valid_utf8(std::string_view field, std::string_view value)
    {
        if (!is_utf8(value))
            return std::unexpected(RegistryError::invalid_input(std::format("{} is not valid UTF-8", field)));
        return {};
    }

    /** Length bound plus encoding check for text that ends up in events */
    inline Result<void> text(std::string_view field, std::string_view value, std::size_t max)
    {
        if (auto r = max_length(field, value, max); !r)
            return r;
        return valid_utf8(field, value);
    }

    inline Result<void> non_empty(std::string_view field, std::string_view value)
    {
        if (value.empty())
            return std::unexpected(RegistryError::invalid_input(std::format("{} must not be empty", field)));
        return {};
    }

    inline Result<void> non_zero(std::string_view field, const Address &address)
    {
        if (address.is_zero())
            return std::unexpected(RegistryError::zero_address(std::string(field)));
        return {};
    }

} // namespace agentreg::checks
