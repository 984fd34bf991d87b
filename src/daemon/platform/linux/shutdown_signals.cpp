#include "platform/linux/shutdown_signals.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <sys/signalfd.h>

namespace {

sigset_t shutdown_mask() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

} // namespace

std::expected<void, std::string> block_shutdown_signals() {
    sigset_t mask = shutdown_mask();
    // pthread_sigmask returns the error instead of setting errno
    if (int rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr); rc != 0) {
        return std::unexpected(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
    return {};
}

std::expected<int, std::string> open_shutdown_signalfd() {
    sigset_t mask = shutdown_mask();
    int fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(std::string("signalfd failed: ") + std::strerror(errno));
    }
    return fd;
}
