#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gesu::transfer {

enum class Direction {
    Push,  ///< Host → device
    Pull   ///< Device → host
};

/**
 * STATE TRANSITIONS:
 * Queued → Transferring → Complete | Failed | Cancelled
 * Queued → Cancelled (never started)
 */
enum class TransferStatus {
    Queued,
    Transferring,
    Complete,
    Failed,
    Cancelled
};

const char* to_string(Direction direction) noexcept;
const char* to_string(TransferStatus status) noexcept;
std::optional<Direction> parse_direction(std::string_view text);

bool is_terminal(TransferStatus status) noexcept;
bool can_transition(TransferStatus from, TransferStatus to) noexcept;

struct PathPair {
    std::string source;
    std::string destination;
};

/**
 * @brief Snapshot of one push/pull unit
 *
 * transferred_bytes never decreases while the job runs and never exceeds
 * total_bytes once the total is known. An empty total_bytes means progress
 * is indeterminate until the job completes.
 */
struct TransferJob {
    std::string id;
    Direction direction = Direction::Push;
    std::string device_id;
    std::string source;
    std::string destination;
    std::string file_name;
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t transferred_bytes = 0;
    TransferStatus status = TransferStatus::Queued;
    std::optional<std::string> error;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

} // namespace gesu::transfer
