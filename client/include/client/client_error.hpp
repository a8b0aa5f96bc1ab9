#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>

namespace Client
{
    enum class ClientErrorType
    {
        // Rejected before anything was sent.
        InvalidRequest,
        NotIdle,
        NotBusy,
        AlreadyCancelling,
        NotAuthenticated,
        // The event channel did not accept an event.
        ChannelFailure,
        // The worker sent something it should not have.
        ProtocolViolation,
        NoConflictSession,
        SessionFinalized,
        NoScanResult,
        NoDuplicateGroups,
        NothingSelected,
        InvalidSelection,
        // A request/response call failed.
        ApiFailure,
        OpenFailed
    };

    inline std::string toString(ClientErrorType type)
    {
        switch (type)
        {
            case ClientErrorType::InvalidRequest:
                return "InvalidRequest";
            case ClientErrorType::NotIdle:
                return "NotIdle";
            case ClientErrorType::NotBusy:
                return "NotBusy";
            case ClientErrorType::AlreadyCancelling:
                return "AlreadyCancelling";
            case ClientErrorType::NotAuthenticated:
                return "NotAuthenticated";
            case ClientErrorType::ChannelFailure:
                return "ChannelFailure";
            case ClientErrorType::ProtocolViolation:
                return "ProtocolViolation";
            case ClientErrorType::NoConflictSession:
                return "NoConflictSession";
            case ClientErrorType::SessionFinalized:
                return "SessionFinalized";
            case ClientErrorType::NoScanResult:
                return "NoScanResult";
            case ClientErrorType::NoDuplicateGroups:
                return "NoDuplicateGroups";
            case ClientErrorType::NothingSelected:
                return "NothingSelected";
            case ClientErrorType::InvalidSelection:
                return "InvalidSelection";
            case ClientErrorType::ApiFailure:
                return "ApiFailure";
            case ClientErrorType::OpenFailed:
                return "OpenFailed";
        }
        return "INVALID_ENUM_VALUE";
    }

    struct ClientError
    {
        ClientErrorType type;
        std::optional<std::string> extraInfo = std::nullopt;

        std::string toString() const
        {
            if (extraInfo)
                return fmt::format("{}: {}.", Client::toString(type), *extraInfo);
            return Client::toString(type);
        }

        /**
         * @brief What the operator is shown. extraInfo is written for humans where present.
         */
        std::string userMessage() const
        {
            return extraInfo.value_or(Client::toString(type));
        }
    };
}
