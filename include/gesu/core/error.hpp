#pragma once

#include <string>

namespace gesu {

/**
 * @brief Failure categories surfaced by the orchestration core
 *
 * Every lower-level failure (errno, tool exit status, filesystem error)
 * is mapped into one of these before it leaves the core.
 */
enum class ErrorKind {
    Spawn,             ///< Executable missing/unresolvable, or the OS refused
    DuplicateSession,  ///< start() on a key that already has a session
    SessionNotFound,   ///< stop() on an absent key
    DeviceUnready,     ///< Device not attached or not in the ready state
    TransferIO,        ///< Source unreadable, destination unwritable, tool failure
    Cancellation,      ///< Cancel on a terminal job (reported as success by cancel())
    TransferNotFound,  ///< Unknown transfer identifier
    InvalidArgument,   ///< Malformed command or argument
    Config             ///< Configuration file unreadable or malformed
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// "<kind>: <message>", suitable for logs
    [[nodiscard]] std::string describe() const;
};

/// Stable wire name, e.g. "SpawnError"
const char* to_string(ErrorKind kind) noexcept;

/// Short hint the UI can show next to the message
const char* user_guidance(ErrorKind kind) noexcept;

} // namespace gesu
