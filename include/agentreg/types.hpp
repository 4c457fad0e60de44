#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <stdexcept>
#include <string>

namespace agentreg
{

    /**
     * Broad classes of failure. Every ErrorCode belongs to exactly one.
     */
    enum class ErrorKind
    {
        Input,
        Reference,
        Authorization,
        State,
        Integrity,
        Environment
    };

    enum class ErrorCode
    {
        // input validation
        InvalidInput,
        ZeroAddress,
        FieldTooLong,
        LengthMismatch,
        ScoreOutOfRange,
        ReservedKey,

        // referential integrity
        AgentNotFound,
        FeedbackNotFound,
        RequestNotFound,
        IncidentNotFound,

        // authorization
        Unauthorized,
        SelfFeedback,
        TransferRejected,

        // state machine
        AlreadyActive,
        AlreadyInactive,
        AlreadyRevoked,
        FeedbackRevoked,
        ThreadFull,
        InvalidTransition,
        DelegationExpired,
        InvalidSignature,

        // integrity invariants
        IntegrityViolation,

        // environment
        ConfigError,
        CryptoError,
        StorageError,
        ParsingError,
        IOError
    };

    ErrorKind kind_of(ErrorCode code);

    std::string error_code_to_string(ErrorCode code);

    /**
     * Registry error with code and message
     */
    class RegistryError : public std::runtime_error
    {
    public:
        ErrorCode code;

        RegistryError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        ErrorKind kind() const { return kind_of(code); }

        static RegistryError invalid_input(const std::string &msg)
        {
            return RegistryError(ErrorCode::InvalidInput, msg);
        }

        static RegistryError zero_address(const std::string &what)
        {
            return RegistryError(ErrorCode::ZeroAddress, std::format("{} must not be the zero address", what));
        }

        static RegistryError too_long(const std::string &field, std::size_t max)
        {
            return RegistryError(ErrorCode::FieldTooLong,
                                 std::format("{} exceeds {} characters", field, max));
        }

        static RegistryError unauthorized(const std::string &msg)
        {
            return RegistryError(ErrorCode::Unauthorized, msg);
        }

        static RegistryError agent_not_found(uint64_t agent_id)
        {
            return RegistryError(ErrorCode::AgentNotFound, std::format("agent {} does not exist", agent_id));
        }

        static RegistryError transition(const std::string &msg)
        {
            return RegistryError(ErrorCode::InvalidTransition, msg);
        }

        static RegistryError integrity(const std::string &msg)
        {
            return RegistryError(ErrorCode::IntegrityViolation, msg);
        }

        static RegistryError config(const std::string &msg)
        {
            return RegistryError(ErrorCode::ConfigError, msg);
        }

        static RegistryError crypto(const std::string &msg)
        {
            return RegistryError(ErrorCode::CryptoError, msg);
        }

        static RegistryError storage(const std::string &msg)
        {
            return RegistryError(ErrorCode::StorageError, msg);
        }

        static RegistryError parsing(const std::string &msg)
        {
            return RegistryError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, RegistryError>;

} // namespace agentreg
