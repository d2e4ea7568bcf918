/**
 * @file events.hpp
 * @brief Event types emitted by the orchestration core
 *
 * NAMING CONVENTION:
 * Events are past tense and carry a snapshot, never a reference into the
 * registry or queue, so handlers can keep them after the entity is gone.
 */

#pragma once

#include "gesu/session/types.hpp"
#include "gesu/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace gesu::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief A mirroring process was spawned and the session is Running
 *
 * WHO EMITS: SessionRegistry::start
 */
struct SessionStartedEvent {
    session::Session session;
};

/**
 * @brief A session ended because stop() was requested
 *
 * WHO EMITS: SessionRegistry::stop
 */
struct SessionStoppedEvent {
    session::Session session;
};

/**
 * @brief The process of a Running session exited on its own
 *
 * WHO EMITS: SessionRegistry::mark_crashed, driven by SessionMonitor
 * WHO SUBSCRIBES: logger, metrics, the sidecar (surfaced to the UI)
 */
struct SessionCrashedEvent {
    session::Session session;
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

struct TransferQueuedEvent {
    transfer::TransferJob job;
};

struct TransferStartedEvent {
    transfer::TransferJob job;
};

/**
 * @brief Best-effort byte progress of a running transfer
 *
 * Only emitted when the tool output could be parsed.
 */
struct TransferProgressEvent {
    std::string job_id;
    std::uint64_t transferred_bytes = 0;
    std::optional<std::uint64_t> total_bytes;
};

/**
 * @brief A job reached Complete, Failed or Cancelled
 */
struct TransferFinishedEvent {
    transfer::TransferJob job;
    std::chrono::milliseconds duration{0};
};

} // namespace gesu::events
