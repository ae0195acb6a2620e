#include "tui/Signal.hpp"

#include <csignal>

std::atomic_bool g_sigint_received{false};

static void SigintHandler(int) {
    g_sigint_received.store(true, std::memory_order_relaxed);
}

void IgnoreSigpipe() {
    struct sigaction action {};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    sigaction(SIGPIPE, &action, nullptr);
}

void InitSignalHandlers() {
    g_sigint_received.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = SigintHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);

    IgnoreSigpipe();
}
