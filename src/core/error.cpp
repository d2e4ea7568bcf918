#include "gesu/core/error.hpp"

namespace gesu {

std::string Error::describe() const {
    return std::string(to_string(kind)) + ": " + message;
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Spawn:            return "SpawnError";
        case ErrorKind::DuplicateSession: return "DuplicateSessionError";
        case ErrorKind::SessionNotFound:  return "SessionNotFoundError";
        case ErrorKind::DeviceUnready:    return "DeviceUnreadyError";
        case ErrorKind::TransferIO:       return "TransferIOError";
        case ErrorKind::Cancellation:     return "CancellationError";
        case ErrorKind::TransferNotFound: return "TransferNotFoundError";
        case ErrorKind::InvalidArgument:  return "InvalidArgumentError";
        case ErrorKind::Config:           return "ConfigError";
    }
    return "UnknownError";
}

const char* user_guidance(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Spawn:
            return "Install the tool or set its path in the configuration file.";
        case ErrorKind::DuplicateSession:
            return "A session is already running for this device. Stop it first.";
        case ErrorKind::SessionNotFound:
            return "The session has already ended. Refresh the session list.";
        case ErrorKind::DeviceUnready:
            return "Ensure the cable is connected, USB debugging is enabled and the device is authorized.";
        case ErrorKind::TransferIO:
            return "File transfer failed. Check device connection and storage permissions.";
        case ErrorKind::Cancellation:
            return "The operation had already finished.";
        case ErrorKind::TransferNotFound:
            return "The transfer is no longer tracked. Refresh the transfer list.";
        case ErrorKind::InvalidArgument:
            return "The request was malformed.";
        case ErrorKind::Config:
            return "Fix or remove the configuration file and restart.";
    }
    return "";
}

} // namespace gesu
