/**
 * @file resource_accountant.hpp
 * @brief Reduction of the memory sample feed to usage metrics
 *
 * **Feed Format** (one sample per line, written by memory_profiler.sh):
 * ```
 * <timestamp_ns> <resident_kb>
 * ```
 *
 * **Reduction**:
 * - peak_memory_kb = max resident_kb (0 when empty)
 * - duration_ms    = (last.ts - first.ts) / 1e6 (0 with fewer than 2 samples)
 * - integral_kb_ms = sum over samples of the running maximum resident_kb,
 *                    saturating at INT64_MAX
 * - memory_series  = the input samples, unchanged
 *
 * The integral weights each sample by the peak seen so far, not by its own
 * value. It is not a trapezoidal area and must stay that way for results to
 * remain comparable with earlier runs.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <filesystem>

namespace monolith {
namespace core {

/**
 * @struct MemorySample
 * @brief One resident-set reading of the payload process
 */
struct MemorySample {
    std::int64_t timestamp_ns{0};   ///< Wall clock, nanoseconds since epoch
    std::int64_t resident_kb{0};    ///< Resident set size (KB)

    bool operator==(const MemorySample& other) const {
        return timestamp_ns == other.timestamp_ns && resident_kb == other.resident_kb;
    }
};

/**
 * @struct ResourceUsage
 * @brief Reduced usage metrics of one profiled run
 */
struct ResourceUsage {
    std::int64_t peak_memory_kb{0};
    double duration_ms{0.0};
    std::int64_t integral_kb_ms{0};
    std::vector<MemorySample> memory_series;
};

/**
 * @class ResourceAccountant
 * @brief Incremental accumulator over the sample feed
 *
 * Samples are fed in arrival order; Snapshot() returns the same metrics as
 * Reduce() over everything added so far.
 */
class ResourceAccountant {
public:
    static constexpr std::size_t DEFAULT_MAX_SAMPLES = 1000000;

    explicit ResourceAccountant(std::size_t max_samples = DEFAULT_MAX_SAMPLES);

    /**
     * @brief Account one sample
     * @return false if the sample was dropped because the series is full
     */
    bool Add(const MemorySample& sample);

    /// Metrics over all accepted samples
    ResourceUsage Snapshot() const;

    void Reset();

    std::size_t SampleCount() const { return usage_.memory_series.size(); }
    std::size_t DroppedCount() const { return dropped_; }

    /**
     * @brief Parse feed text into samples
     *
     * Blank lines are skipped. Any line that is not exactly two non-negative
     * integers, or that is longer than 128 characters, makes the whole feed
     * invalid and yields an empty series. Reading stops once `max_samples`
     * samples are held; the rest of the feed is ignored.
     *
     * @param text Feed contents
     * @param max_samples Series bound
     * @return Parsed samples (empty on malformed input)
     */
    static std::vector<MemorySample> ParseFeed(const std::string& text,
                                               std::size_t max_samples = DEFAULT_MAX_SAMPLES);

    /**
     * @brief Read and parse a feed file
     *
     * The file is streamed line by line, so host memory stays bounded by
     * `max_samples` whatever the file size.
     *
     * @return Parsed samples (empty if unreadable or malformed)
     */
    static std::vector<MemorySample> ParseFeedFile(const std::filesystem::path& path,
                                                   std::size_t max_samples = DEFAULT_MAX_SAMPLES);

    /// Reduce a complete series
    static ResourceUsage Reduce(const std::vector<MemorySample>& samples);

private:
    std::size_t max_samples_;
    std::size_t dropped_{0};
    std::int64_t running_peak_{0};
    ResourceUsage usage_;
};

} // namespace core
} // namespace monolith
