#include "audio/StopSignal.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>

namespace {

std::atomic<bool> g_stopRequested{false};

static_assert(std::atomic<bool>::is_always_lock_free,
              "stop flag is written from a signal handler");

void handleStopSignal(int) {
    g_stopRequested.store(true);
}

}  // namespace

bool StopSignal::install() {
    if (std::signal(SIGUSR1, handleStopSignal) == SIG_ERR) {
        spdlog::error("Failed to set up SIGUSR1 handler");
        return false;
    }
    spdlog::debug("SIGUSR1 stop handler installed");
    return true;
}

bool StopSignal::requested() {
    return g_stopRequested.load();
}

void StopSignal::raise() {
    g_stopRequested.store(true);
}

void StopSignal::reset() {
    g_stopRequested.store(false);
}
