#pragma once

#include "download/download_outcome.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ipswdl {

// Accumulates counters for one run and formats the lines reported about it.
// Performs no I/O.
class RunReport {
public:
    using Clock = std::chrono::steady_clock;

    explicit RunReport(std::uint32_t total, Clock::time_point started = Clock::now());

    // Cancelled outcomes are tallied but never counted as done.
    void Record(const DownloadOutcome& outcome);

    std::uint32_t Total() const { return total_; }
    std::uint32_t Done() const { return done_; }
    std::uint32_t CompletedCount() const { return completed_; }
    std::uint32_t SkippedCount() const { return skipped_; }
    std::uint32_t FailedCount() const { return failed_; }
    std::uint32_t CancelledCount() const { return cancelled_; }

    std::string ProgressLine(const std::string& device_name) const;
    std::string ElapsedLine(Clock::time_point now = Clock::now()) const;
    std::string TallyLine() const;

private:
    Clock::time_point started_;
    std::uint32_t total_;
    std::uint32_t done_ = 0;
    std::uint32_t completed_ = 0;
    std::uint32_t skipped_ = 0;
    std::uint32_t failed_ = 0;
    std::uint32_t cancelled_ = 0;
};

} // namespace ipswdl
