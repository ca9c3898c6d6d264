#include "StopFlag.hpp"

#include <atomic>
#include <csignal>

namespace {
std::atomic<bool> g_stopRequested{false};

void HandleStopSignal(int) {
    g_stopRequested.store(true);
}
} // namespace

void RequestStop() {
    g_stopRequested.store(true);
}

bool StopRequested() {
    return g_stopRequested.load();
}

void ResetStop() {
    g_stopRequested.store(false);
}

void InstallStopHandlers() {
    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);
}
