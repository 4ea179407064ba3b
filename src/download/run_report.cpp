#include "download/run_report.hpp"

#include <variant>

namespace ipswdl {

RunReport::RunReport(std::uint32_t total, Clock::time_point started)
    : started_(started), total_(total) {}

void RunReport::Record(const DownloadOutcome& outcome) {
    if (IsCancelled(outcome)) {
        ++cancelled_;
        return;
    }

    ++done_;
    if (std::holds_alternative<Completed>(outcome)) {
        ++completed_;
    } else if (std::holds_alternative<Skipped>(outcome)) {
        ++skipped_;
    } else {
        ++failed_;
    }
}

std::string RunReport::ProgressLine(const std::string& device_name) const {
    return "Ended work on: " + device_name + " (" + std::to_string(done_) + "/" +
           std::to_string(total_) + ")";
}

std::string RunReport::ElapsedLine(Clock::time_point now) const {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(now - started_).count();
    return "Finished in " + std::to_string(minutes < 0 ? 0 : minutes) + " minutes.";
}

std::string RunReport::TallyLine() const {
    return std::to_string(completed_) + " downloaded, " + std::to_string(skipped_) + " skipped, " +
           std::to_string(failed_) + " failed";
}

} // namespace ipswdl
