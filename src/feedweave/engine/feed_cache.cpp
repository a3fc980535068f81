#include "feedweave/engine/feed_cache.hpp"

namespace feedweave
{

FeedCache::FeedCache(std::chrono::milliseconds ttl, ClockPtr clock)
    : m_ttl{clamp_cache_ttl(ttl)}
    , m_clock{clock ? std::move(clock) : std::make_shared<SystemClock>()}
{}

void FeedCache::store(FeedResultPtr result)
{
    m_result = std::move(result);
    m_cached_at = m_clock->now();
}

FeedResultPtr FeedCache::fresh() const
{
    if (!m_result || !m_cached_at)
    {
        return nullptr;
    }
    if (m_clock->now() - *m_cached_at > m_ttl)
    {
        return nullptr;
    }
    return m_result;
}

void FeedCache::clear() noexcept
{
    m_result.reset();
    m_cached_at.reset();
}

} // namespace feedweave
