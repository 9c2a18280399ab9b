/**
 * @file resource_accountant.cpp
 * @brief Reduction of the memory sample feed to usage metrics
 *
 * @date 2025
 */

#include "monolith/core/resource_accountant.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <istream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace monolith {
namespace core {

using utils::StringUtils;

namespace {

// Longest valid line is two 19-digit fields and a separator
constexpr std::size_t kMaxLineLength = 128;

bool ParseNonNegative(const std::string& token, std::int64_t& value) {
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(token, &consumed, 10);
        if (consumed != token.size() || parsed < 0) {
            return false;
        }
        value = static_cast<std::int64_t>(parsed);
        return true;
    }
    catch (const std::invalid_argument&) {
        return false;
    }
    catch (const std::out_of_range&) {
        return false;
    }
}

/**
 * Read one line of at most kMaxLineLength characters. Longer lines are not
 * buffered: `too_long` is set and the caller treats the feed as malformed.
 */
bool ReadBoundedLine(std::istream& in, std::string& line, bool& too_long) {
    line.clear();
    too_long = false;
    bool any = false;
    std::istream::int_type c;
    while ((c = in.get()) != std::istream::traits_type::eof()) {
        any = true;
        if (c == '\n') {
            return true;
        }
        if (line.size() >= kMaxLineLength) {
            too_long = true;
            return true;
        }
        line.push_back(static_cast<char>(c));
    }
    return any;
}

std::vector<MemorySample> ParseStream(std::istream& in, std::size_t max_samples) {
    std::vector<MemorySample> samples;
    std::string line;
    bool too_long = false;
    std::size_t line_number = 0;

    while (ReadBoundedLine(in, line, too_long)) {
        ++line_number;
        if (too_long) {
            spdlog::error("Memory sample on line {} exceeds {} characters", line_number,
                          kMaxLineLength);
            return {};
        }

        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.empty()) {
            continue;
        }

        MemorySample sample;
        if (fields.size() != 2 ||
            !ParseNonNegative(fields[0], sample.timestamp_ns) ||
            !ParseNonNegative(fields[1], sample.resident_kb)) {
            spdlog::error("Malformed memory sample on line {}: '{}'", line_number,
                          StringUtils::Truncate(line, 80));
            return {};
        }

        if (samples.size() >= max_samples) {
            spdlog::warn("Memory feed exceeded {} samples, ignoring the rest from line {}",
                         max_samples, line_number);
            break;
        }
        samples.push_back(sample);
    }
    return samples;
}

} // anonymous namespace

ResourceAccountant::ResourceAccountant(std::size_t max_samples)
    : max_samples_(max_samples) {
}

bool ResourceAccountant::Add(const MemorySample& sample) {
    if (usage_.memory_series.size() >= max_samples_) {
        ++dropped_;
        return false;
    }

    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();

    running_peak_ = std::max(running_peak_, sample.resident_kb);
    usage_.peak_memory_kb = running_peak_;
    // Saturates instead of wrapping
    usage_.integral_kb_ms = (usage_.integral_kb_ms > kMax - running_peak_)
        ? kMax
        : usage_.integral_kb_ms + running_peak_;

    if (!usage_.memory_series.empty()) {
        auto first = usage_.memory_series.front().timestamp_ns;
        // Unsigned difference is exact for any ordered pair of int64 values
        usage_.duration_ms = sample.timestamp_ns > first
            ? static_cast<double>(static_cast<std::uint64_t>(sample.timestamp_ns) -
                                  static_cast<std::uint64_t>(first)) / 1e6
            : 0.0;
    }
    usage_.memory_series.push_back(sample);
    return true;
}

ResourceUsage ResourceAccountant::Snapshot() const {
    return usage_;
}

void ResourceAccountant::Reset() {
    usage_ = ResourceUsage{};
    running_peak_ = 0;
    dropped_ = 0;
}

// ============================================================================
// FEED PARSING
// ============================================================================

std::vector<MemorySample> ResourceAccountant::ParseFeed(const std::string& text,
                                                        std::size_t max_samples) {
    std::istringstream stream(text);
    return ParseStream(stream, max_samples);
}

std::vector<MemorySample> ResourceAccountant::ParseFeedFile(const std::filesystem::path& path,
                                                            std::size_t max_samples) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open memory feed: {}", path.string());
        return {};
    }
    return ParseStream(file, max_samples);
}

ResourceUsage ResourceAccountant::Reduce(const std::vector<MemorySample>& samples) {
    ResourceAccountant accountant(std::max<std::size_t>(samples.size(), 1));
    for (const auto& sample : samples) {
        accountant.Add(sample);
    }
    return accountant.Snapshot();
}

} // namespace core
} // namespace monolith
