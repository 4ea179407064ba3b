#pragma once
#include <cstdint>
#include <string_view>

namespace ipswdl {

struct ProgressEvent {
    std::string_view device;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0; // 0 => unknown

    std::uint32_t device_index = 0; // 1-based position in the run
    std::uint32_t device_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace ipswdl
