#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace gesu::transfer {

struct ProgressSample {
    enum class Kind {
        Percent,  ///< value in [0, 100]
        Bytes     ///< absolute byte count
    };
    Kind kind = Kind::Bytes;
    std::uint64_t value = 0;
};

/**
 * @brief Translates one line of transfer-tool output into progress
 *
 * Implementations return nullopt for anything they do not recognise;
 * they never fail.
 */
class ProgressParser {
public:
    virtual ~ProgressParser() = default;
    [[nodiscard]] virtual std::optional<ProgressSample> parse(const std::string& line) const = 0;
};

/**
 * @brief Recognises adb push/pull output
 *
 * "[ 42%] /sdcard/Download/a.bin"                          → 42 %
 * "a.bin: 1 file pushed, 0 skipped. 3.1 MB/s (4096 bytes in 0.001s)" → 4096 bytes
 */
class AdbProgressParser final : public ProgressParser {
public:
    [[nodiscard]] std::optional<ProgressSample> parse(const std::string& line) const override;
};

/**
 * @brief Best-effort progress tracker for one running transfer
 *
 * Applies parsed samples monotonically and clamps them to the known
 * total. When nothing parses, progress stays at 0 until on_success()
 * reports the whole file (binary progress).
 */
class ProgressReporter {
public:
    ProgressReporter(std::shared_ptr<const ProgressParser> parser,
                     std::optional<std::uint64_t> total_bytes);

    /// New byte count when this line advanced progress
    std::optional<std::uint64_t> on_line(const std::string& line);

    /**
     * @brief Final byte count for a successful transfer
     *
     * @p final_size is the size observed on disk after the tool exited,
     * used when the total was not known up front.
     */
    std::uint64_t on_success(std::optional<std::uint64_t> final_size = std::nullopt);

    [[nodiscard]] std::uint64_t transferred() const noexcept { return transferred_; }
    [[nodiscard]] std::optional<std::uint64_t> total() const noexcept { return total_; }

    /// True while no output line has been understood
    [[nodiscard]] bool degraded() const noexcept { return !parsed_any_; }

private:
    std::shared_ptr<const ProgressParser> parser_;
    std::optional<std::uint64_t> total_;
    std::uint64_t transferred_ = 0;
    std::optional<std::uint64_t> reported_bytes_;  ///< Summary line count, if seen
    bool parsed_any_ = false;
};

} // namespace gesu::transfer
