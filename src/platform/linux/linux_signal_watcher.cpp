#include "platform/signal_watcher.hpp"

#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

SignalWatcher::SignalWatcher(std::stop_source source) : source_(std::move(source)) {}

SignalWatcher::~SignalWatcher() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool SignalWatcher::start() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        logging::error("pthread_sigmask failed: {}", std::strerror(errno));
        return false;
    }

    signal_fd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        logging::error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    thread_ = std::jthread([this](std::stop_token stop) { watch(stop); });
    return true;
}

void SignalWatcher::watch(std::stop_token stop) {
    pollfd pfd{.fd = signal_fd_, .events = POLLIN, .revents = 0};
    while (!stop.stop_requested()) {
        int n = ::poll(&pfd, 1, 200);
        if (n < 0) {
            if (errno == EINTR) continue;
            logging::error("poll on signalfd failed: {}", std::strerror(errno));
            return;
        }
        if (n == 0) continue;

        signalfd_siginfo info;
        if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
            logging::warn("received signal {}, cancelling", info.ssi_signo);
            signalled_.store(true, std::memory_order_release);
            source_.request_stop();
            return;
        }
    }
}
