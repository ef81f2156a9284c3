#include "TimerInterface.hpp"
#include <chrono>
#include <thread>

uint64_t SteadyTimer::now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

void SteadyTimer::sleepUntil(uint64_t deadlineMs) {
    uint64_t current = now();
    if (deadlineMs > current) {
        std::this_thread::sleep_for(std::chrono::milliseconds(deadlineMs - current));
    }
}
