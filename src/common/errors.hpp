#pragma once

#include <optional>
#include <string>

#include "common/result.hpp"

namespace fleetsync {

// Failure classes reported by a FleetClient.
enum class ClientErrorKind {
    Authentication,
    Api
};

struct ClientError {
    ClientErrorKind kind = ClientErrorKind::Api;
    std::string message;
    int httpStatus = 0;
};

// Failure classes reported by the coordinator and the task commands.
enum class SyncErrorKind {
    ReauthenticationRequired,
    UpdateFailed,
    CommandFailed
};

struct SyncError {
    SyncErrorKind kind = SyncErrorKind::UpdateFailed;
    std::string message;
    std::optional<ClientError> cause;
};

template <typename T>
using ClientResult = Result<T, ClientError>;

template <typename T>
using SyncResult = Result<T, SyncError>;

inline ClientError authenticationError(std::string message, int httpStatus = 0)
{
    return ClientError{ClientErrorKind::Authentication, std::move(message), httpStatus};
}

inline ClientError apiError(std::string message, int httpStatus = 0)
{
    return ClientError{ClientErrorKind::Api, std::move(message), httpStatus};
}

// Maps a client failure seen during a refresh round onto the two refresh outcomes.
inline SyncError classifyRefreshFailure(const ClientError &error)
{
    if (error.kind == ClientErrorKind::Authentication) {
        return SyncError{SyncErrorKind::ReauthenticationRequired,
                         "Authentication failed. Please reconfigure the account: "
                             + error.message,
                         error};
    }
    return SyncError{SyncErrorKind::UpdateFailed,
                     "Error communicating with API: " + error.message,
                     error};
}

inline SyncError commandFailure(const std::string &command, const ClientError &error)
{
    return SyncError{SyncErrorKind::CommandFailed,
                     "Failed to " + command + ": " + error.message,
                     error};
}

inline SyncError invalidCommand(const std::string &command, const std::string &reason)
{
    return SyncError{SyncErrorKind::CommandFailed,
                     "Failed to " + command + ": " + reason,
                     std::nullopt};
}

inline std::string toString(ClientErrorKind kind)
{
    switch (kind) {
    case ClientErrorKind::Authentication:
        return "authentication";
    case ClientErrorKind::Api:
        return "api";
    }
    return "api";
}

inline std::string toString(SyncErrorKind kind)
{
    switch (kind) {
    case SyncErrorKind::ReauthenticationRequired:
        return "reauthentication_required";
    case SyncErrorKind::UpdateFailed:
        return "update_failed";
    case SyncErrorKind::CommandFailed:
        return "command_failed";
    }
    return "update_failed";
}

} // namespace fleetsync
