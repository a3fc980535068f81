/**
 * @file refresh_timer.hpp
 * @brief PeriodicRefreshTimer, a re-armable one-shot timer on an io_context.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace feedweave
{

/**
 * @brief Single pending deadline that fires a callback on the io_context thread.
 *
 * @details
 * Only the most recent arm() can fire: arming again, or cancel(), supersedes
 * the pending wait. Each arm() takes a new generation number and the
 * completion handler checks it, so a wait whose cancellation raced with its
 * expiry is still ignored.
 *
 * The handler keeps the shared state alive on its own, so destroying the
 * timer with a wait pending is safe; the callback is then never invoked.
 *
 * @par Thread Safety
 * - Not thread-safe. Use from the thread running the io_context.
 */
class PeriodicRefreshTimer
{
public:
    using Callback = std::function<void()>;

    explicit PeriodicRefreshTimer(boost::asio::io_context& io);
    ~PeriodicRefreshTimer();

    PeriodicRefreshTimer(const PeriodicRefreshTimer&) = delete;
    PeriodicRefreshTimer& operator=(const PeriodicRefreshTimer&) = delete;

    /**
     * @brief Fire `on_fire` once, `delay` from now, replacing any pending wait.
     */
    void arm(std::chrono::milliseconds delay, Callback on_fire);

    /**
     * @brief Drop the pending wait, if any.
     */
    void cancel();

    /**
     * @brief Whether a wait is pending.
     */
    bool armed() const noexcept;

private:
    struct State
    {
        uint64_t generation{0};
        bool armed{false};
    };

    boost::asio::steady_timer m_timer;
    std::shared_ptr<State> m_state;
};

} // namespace feedweave
