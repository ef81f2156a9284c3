#pragma once

#include <cstdint>

/**
 * Abstract clock used for receive windows, join backoff and duty cycle.
 *
 * sleepUntil() may return late or early; callers re-check now() afterwards.
 */
class TimerInterface {
public:
    virtual ~TimerInterface() = default;

    /**
     * @brief Milliseconds on a monotonic clock
     */
    virtual uint64_t now() = 0;

    /**
     * @brief Suspend until @p deadlineMs (a value of now())
     */
    virtual void sleepUntil(uint64_t deadlineMs) = 0;
};

/**
 * TimerInterface on std::chrono::steady_clock
 */
class SteadyTimer : public TimerInterface {
public:
    uint64_t now() override;
    void sleepUntil(uint64_t deadlineMs) override;
};
