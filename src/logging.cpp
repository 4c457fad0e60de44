#include "agentreg/logging.hpp"
#include <format>
#include <spdlog/spdlog.h>

namespace agentreg::logging
{

    Result<void> init(const std::string &level)
    {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && level != "off")
        {
            return std::unexpected(RegistryError::config(std::format("Unknown log level: {}", level)));
        }
        spdlog::set_level(parsed);
        spdlog::set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v");
        return {};
    }

} // namespace agentreg::logging
