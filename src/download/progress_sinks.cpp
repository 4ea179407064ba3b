#include "download/progress_sinks.hpp"

namespace ipswdl {

namespace {
bool g_progress_line_active = false;

constexpr double kMiB = 1024.0 * 1024.0;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string device(e.device);
    if (device != last_device_) {
        last_device_ = device;
        last_pct_ = -1;
        last_mib_ = ~0ULL;
    }

    int pct = -1;
    if (e.bytes_total > 0) {
        pct = static_cast<int>((e.bytes_done * 100ULL) / e.bytes_total);
        if (pct > 100)
            pct = 100;
    }

    // Redraw only when the visible numbers change.
    const std::uint64_t mib = e.bytes_done / (1024 * 1024);
    if (pct == last_pct_ && mib == last_mib_)
        return;
    last_pct_ = pct;
    last_mib_ = mib;

    if (pct >= 0) {
        std::fprintf(stderr,
                     "\r[%s] %3d%% %.1f/%.1f MiB (%u/%u)",
                     device.c_str(),
                     pct,
                     static_cast<double>(e.bytes_done) / kMiB,
                     static_cast<double>(e.bytes_total) / kMiB,
                     e.device_index,
                     e.device_total);
    } else {
        std::fprintf(stderr,
                     "\r[%s] %.1f MiB (%u/%u)",
                     device.c_str(),
                     static_cast<double>(e.bytes_done) / kMiB,
                     e.device_index,
                     e.device_total);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.bytes_total > 0 && e.bytes_done >= e.bytes_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace ipswdl
