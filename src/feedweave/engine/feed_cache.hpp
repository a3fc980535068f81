/**
 * @file feed_cache.hpp
 * @brief FeedCache holds the last refresh result with a TTL.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/engine/clock.hpp"
#include "feedweave/engine/feed_result.hpp"

namespace feedweave
{

/// TTL used when none is configured: five minutes.
constexpr std::chrono::milliseconds kDefaultCacheTtl{300000};

/// Smallest accepted TTL; prevents timer spin from zero or negative values.
constexpr std::chrono::milliseconds kMinCacheTtl{10};

/**
 * @brief Raise a TTL to kMinCacheTtl if it is below it.
 */
constexpr std::chrono::milliseconds clamp_cache_ttl(std::chrono::milliseconds ttl) noexcept
{
    return ttl < kMinCacheTtl ? kMinCacheTtl : ttl;
}

/**
 * @brief The most recent refresh result and when it was stored.
 *
 * @details
 * fresh() returns the entry only while `now - cached_at <= ttl`; after that
 * the caller is expected to force a pull refresh.
 *
 * @par Thread Safety
 * - No internal synchronization; owned by one engine.
 */
class FeedCache
{
public:
    /**
     * @param ttl Freshness window; raised to kMinCacheTtl if smaller.
     * @param clock Clock used for cached_at and freshness checks.
     */
    FeedCache(std::chrono::milliseconds ttl, ClockPtr clock);

    /**
     * @brief Store a result, stamped with the current time.
     */
    void store(FeedResultPtr result);

    /**
     * @brief Get the cached result if still fresh, otherwise nullptr.
     */
    FeedResultPtr fresh() const;

    /**
     * @brief Get the cached result regardless of age, or nullptr.
     */
    FeedResultPtr last() const noexcept
    {
        return m_result;
    }

    /**
     * @brief When the current entry was stored, if any.
     */
    std::optional<TimePoint> cached_at() const noexcept
    {
        return m_cached_at;
    }

    void clear() noexcept;

    std::chrono::milliseconds ttl() const noexcept
    {
        return m_ttl;
    }

private:
    std::chrono::milliseconds m_ttl;
    ClockPtr m_clock;
    FeedResultPtr m_result{};
    std::optional<TimePoint> m_cached_at{};
};

} // namespace feedweave
