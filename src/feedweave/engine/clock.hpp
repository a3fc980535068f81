/**
 * @file clock.hpp
 * @brief Clock interface used for context time and cache freshness.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/context.hpp"

namespace feedweave
{

/**
 * @brief Source of "now" for the engine.
 *
 * @details
 * Context `time` and cache freshness are read through this interface so tests
 * can substitute a manually advanced clock. The periodic refresh timer always
 * runs on the io_context's steady clock.
 */
class IClock
{
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

using ClockPtr = std::shared_ptr<IClock>;

/**
 * @brief IClock backed by std::chrono::system_clock.
 */
class SystemClock : public IClock
{
public:
    TimePoint now() const override
    {
        return Clock::now();
    }
};

} // namespace feedweave
