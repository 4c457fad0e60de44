#pragma once

#include "types.hpp"
#include <string>

namespace agentreg::logging
{
    /**
     * Configure the default spdlog logger. Accepts spdlog level names
     * ("trace", "debug", "info", "warn", "error", "critical", "off").
     */
    Result<void> init(const std::string &level);

} // namespace agentreg::logging
