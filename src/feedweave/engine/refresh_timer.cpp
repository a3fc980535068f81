#include "feedweave/engine/refresh_timer.hpp"

namespace feedweave
{

PeriodicRefreshTimer::PeriodicRefreshTimer(boost::asio::io_context& io)
    : m_timer{io}
    , m_state{std::make_shared<State>()}
{}

PeriodicRefreshTimer::~PeriodicRefreshTimer()
{
    m_state->armed = false;
    ++m_state->generation;
}

void PeriodicRefreshTimer::arm(std::chrono::milliseconds delay, Callback on_fire)
{
    const uint64_t generation = ++m_state->generation;
    m_state->armed = true;

    // expires_after() aborts the previous wait.
    m_timer.expires_after(delay);
    m_timer.async_wait(
        [state = m_state, generation, on_fire = std::move(on_fire)](const boost::system::error_code& ec)
        {
            if (ec == boost::asio::error::operation_aborted || state->generation != generation)
            {
                return;
            }
            state->armed = false;
            if (on_fire)
            {
                on_fire();
            }
        });
}

void PeriodicRefreshTimer::cancel()
{
    ++m_state->generation;
    m_state->armed = false;
    m_timer.cancel();
}

bool PeriodicRefreshTimer::armed() const noexcept
{
    return m_state->armed;
}

} // namespace feedweave
