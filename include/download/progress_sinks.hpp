#pragma once

#include "download/progress.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

namespace ipswdl {

// Single self-overwriting progress line on stderr.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_device_;
    int last_pct_ = -1;
    std::uint64_t last_mib_ = ~0ULL;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace ipswdl
