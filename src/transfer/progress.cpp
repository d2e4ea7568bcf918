#include "gesu/transfer/progress.hpp"

#include <algorithm>
#include <charconv>
#include <regex>
#include <system_error>

namespace gesu::transfer {

namespace {

/// nullopt when the digits do not fit in 64 bits
std::optional<std::uint64_t> to_u64(const std::ssub_match& digits) {
    const std::string text = digits.str();
    std::uint64_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<ProgressSample> AdbProgressParser::parse(const std::string& line) const {
    static const std::regex percent_pattern{R"(^\s*\[\s*(\d{1,3})%\])"};
    static const std::regex summary_pattern{R"(\((\d+) bytes in [0-9.]+s\))"};

    std::smatch match;
    if (std::regex_search(line, match, summary_pattern)) {
        const auto bytes = to_u64(match[1]);
        if (!bytes) {
            return std::nullopt;
        }
        return ProgressSample{ProgressSample::Kind::Bytes, *bytes};
    }
    if (std::regex_search(line, match, percent_pattern)) {
        const auto percent = to_u64(match[1]);
        if (!percent || *percent > 100) {
            return std::nullopt;
        }
        return ProgressSample{ProgressSample::Kind::Percent, *percent};
    }
    return std::nullopt;
}

ProgressReporter::ProgressReporter(std::shared_ptr<const ProgressParser> parser,
                                   std::optional<std::uint64_t> total_bytes)
    : parser_(std::move(parser)), total_(total_bytes) {}

std::optional<std::uint64_t> ProgressReporter::on_line(const std::string& line) {
    if (!parser_) {
        return std::nullopt;
    }
    const auto sample = parser_->parse(line);
    if (!sample) {
        return std::nullopt;
    }

    std::uint64_t candidate = 0;
    if (sample->kind == ProgressSample::Kind::Percent) {
        if (!total_) {
            return std::nullopt;
        }
        candidate = *total_ / 100 * sample->value + (*total_ % 100) * sample->value / 100;
    } else {
        candidate = sample->value;
        reported_bytes_ = sample->value;
    }
    parsed_any_ = true;

    if (total_) {
        candidate = std::min(candidate, *total_);
    }
    if (candidate <= transferred_) {
        return std::nullopt;
    }
    transferred_ = candidate;
    return transferred_;
}

std::uint64_t ProgressReporter::on_success(std::optional<std::uint64_t> final_size) {
    if (total_) {
        transferred_ = *total_;
    } else if (final_size) {
        transferred_ = std::max(transferred_, *final_size);
        total_ = transferred_;
    } else if (reported_bytes_) {
        transferred_ = std::max(transferred_, *reported_bytes_);
        total_ = transferred_;
    } else {
        total_ = transferred_;
    }
    return transferred_;
}

} // namespace gesu::transfer
