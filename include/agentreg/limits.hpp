#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace agentreg::limits
{

    inline constexpr std::size_t kMaxUriLength = 2048;
    inline constexpr std::size_t kMaxTextLength = 2048;
    inline constexpr std::size_t kMaxTagLength = 128;
    inline constexpr std::size_t kMaxEndpointLength = 512;
    inline constexpr std::size_t kMaxMetadataKeyLength = 128;
    inline constexpr std::size_t kMaxMetadataValueLength = 8192;
    inline constexpr std::size_t kMaxResponsesPerFeedback = 30;

    /** Highest decimal scale accepted for feedback scores */
    inline constexpr uint8_t kMaxScoreDecimals = 18;

    /** Validation outcomes are percentages */
    inline constexpr uint8_t kMaxValidationOutcome = 100;

    /**
     * Outcomes recorded when complete/reject omit an explicit score. Records
     * carrying one of these also have outcome_defaulted set, because the bare
     * number is indistinguishable from an explicit boundary score.
     */
    inline constexpr uint8_t kDefaultCompletionOutcome = kMaxValidationOutcome;
    inline constexpr uint8_t kDefaultRejectionOutcome = 0;

    /** Metadata key owned by the delegation paths; never writable directly */
    inline constexpr std::string_view kAgentWalletKey = "agentWallet";

} // namespace agentreg::limits
