#include "platform/interrupt.hpp"

#include <csignal>
#include <signal.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

} // namespace

namespace platform {

bool install_interrupt_handler() {
    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART
    return ::sigaction(SIGINT, &sa, nullptr) == 0;
}

bool interrupted() {
    return g_interrupted != 0;
}

void clear_interrupt() {
    g_interrupted = 0;
}

} // namespace platform
