#include "gesu/transfer/types.hpp"

namespace gesu::transfer {

const char* to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Push: return "push";
        case Direction::Pull: return "pull";
    }
    return "unknown";
}

const char* to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Queued:       return "queued";
        case TransferStatus::Transferring: return "transferring";
        case TransferStatus::Complete:     return "complete";
        case TransferStatus::Failed:       return "failed";
        case TransferStatus::Cancelled:    return "cancelled";
    }
    return "unknown";
}

std::optional<Direction> parse_direction(std::string_view text) {
    if (text == "push") {
        return Direction::Push;
    }
    if (text == "pull") {
        return Direction::Pull;
    }
    return std::nullopt;
}

bool is_terminal(TransferStatus status) noexcept {
    return status == TransferStatus::Complete ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled;
}

bool can_transition(TransferStatus from, TransferStatus to) noexcept {
    switch (from) {
        case TransferStatus::Queued:
            return to == TransferStatus::Transferring || to == TransferStatus::Cancelled;
        case TransferStatus::Transferring:
            return is_terminal(to);
        default:
            return false;
    }
}

} // namespace gesu::transfer
