#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "daemon: setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Second fork: the session leader exits so no terminal can be reacquired.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Relative paths (history, exports) are resolved by the client first.
    umask(022);
    if (chdir("/") < 0) _exit(1);

    if (!freopen("/dev/null", "r", stdin) ||
        !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

} // namespace platform
