#pragma once

namespace ipswdl {

// True when `fd` is readable within `timeout_ms` (0 polls, -1 waits forever).
// Interrupted waits are retried; errors report false.
bool PollReadable(int fd, int timeout_ms);

} // namespace ipswdl
