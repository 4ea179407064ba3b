#include "io/wait.hpp"

#include <cerrno>
#include <poll.h>

namespace ipswdl {

bool PollReadable(int fd, int timeout_ms) {
    if (fd < 0) return false;

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    while (true) {
        const int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc > 0) return (pfd.revents & (POLLIN | POLLHUP)) != 0;
        if (rc == 0) return false;
        if (errno != EINTR) return false;
    }
}

} // namespace ipswdl
