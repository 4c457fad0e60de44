#include "agentreg/types.hpp"

namespace agentreg
{

    ErrorKind kind_of(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::InvalidInput:
        case ErrorCode::ZeroAddress:
        case ErrorCode::FieldTooLong:
        case ErrorCode::LengthMismatch:
        case ErrorCode::ScoreOutOfRange:
        case ErrorCode::ReservedKey:
            return ErrorKind::Input;

        case ErrorCode::AgentNotFound:
        case ErrorCode::FeedbackNotFound:
        case ErrorCode::RequestNotFound:
        case ErrorCode::IncidentNotFound:
            return ErrorKind::Reference;

        case ErrorCode::Unauthorized:
        case ErrorCode::SelfFeedback:
        case ErrorCode::TransferRejected:
            return ErrorKind::Authorization;

        case ErrorCode::AlreadyActive:
        case ErrorCode::AlreadyInactive:
        case ErrorCode::AlreadyRevoked:
        case ErrorCode::FeedbackRevoked:
        case ErrorCode::ThreadFull:
        case ErrorCode::InvalidTransition:
        case ErrorCode::DelegationExpired:
        case ErrorCode::InvalidSignature:
            return ErrorKind::State;

        case ErrorCode::IntegrityViolation:
            return ErrorKind::Integrity;

        case ErrorCode::ConfigError:
        case ErrorCode::CryptoError:
        case ErrorCode::StorageError:
        case ErrorCode::ParsingError:
        case ErrorCode::IOError:
            return ErrorKind::Environment;
        }
        return ErrorKind::Environment;
    }

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::ZeroAddress:
            return "ZeroAddress";
        case ErrorCode::FieldTooLong:
            return "FieldTooLong";
        case ErrorCode::LengthMismatch:
            return "LengthMismatch";
        case ErrorCode::ScoreOutOfRange:
            return "ScoreOutOfRange";
        case ErrorCode::ReservedKey:
            return "ReservedKey";
        case ErrorCode::AgentNotFound:
            return "AgentNotFound";
        case ErrorCode::FeedbackNotFound:
            return "FeedbackNotFound";
        case ErrorCode::RequestNotFound:
            return "RequestNotFound";
        case ErrorCode::IncidentNotFound:
            return "IncidentNotFound";
        case ErrorCode::Unauthorized:
            return "Unauthorized";
        case ErrorCode::SelfFeedback:
            return "SelfFeedback";
        case ErrorCode::TransferRejected:
            return "TransferRejected";
        case ErrorCode::AlreadyActive:
            return "AlreadyActive";
        case ErrorCode::AlreadyInactive:
            return "AlreadyInactive";
        case ErrorCode::AlreadyRevoked:
            return "AlreadyRevoked";
        case ErrorCode::FeedbackRevoked:
            return "FeedbackRevoked";
        case ErrorCode::ThreadFull:
            return "ThreadFull";
        case ErrorCode::InvalidTransition:
            return "InvalidTransition";
        case ErrorCode::DelegationExpired:
            return "DelegationExpired";
        case ErrorCode::InvalidSignature:
            return "InvalidSignature";
        case ErrorCode::IntegrityViolation:
            return "IntegrityViolation";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

} // namespace agentreg
