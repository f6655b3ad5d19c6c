/**
 * @file clock.hpp
 * @brief Time source and timed delays used by waits and settle delays
 */

#ifndef CAPSCALE_CLOCK_HPP
#define CAPSCALE_CLOCK_HPP

#include <chrono>

namespace capscale {

/**
 * @brief Abstract monotonic clock with blocking sleep
 *
 * All suspension points of a run go through this interface so that tests can
 * drive waits in virtual time.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(std::chrono::seconds duration) = 0;
};

/**
 * @brief Wall-clock implementation backed by std::chrono::steady_clock
 */
class SystemClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(std::chrono::seconds duration) override;
};

} // namespace capscale

#endif // CAPSCALE_CLOCK_HPP
