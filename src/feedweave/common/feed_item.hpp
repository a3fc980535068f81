/**
 * @file feed_item.hpp
 * @brief FeedItem and the ranking hints sources may attach to it.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/context.hpp"
#include "feedweave/common/datum.hpp"

namespace feedweave
{

/**
 * @brief How time-sensitive an item is relative to now.
 */
enum class TimeRelevance
{
    Imminent,   ///< Needs attention now (event starting in minutes, severe alert).
    Upcoming,   ///< Relevant soon (event in the next hour).
    Ambient     ///< Background information (daily forecast).
};

inline const char* to_string(TimeRelevance relevance) noexcept
{
    switch (relevance)
    {
        case TimeRelevance::Imminent: return "imminent";
        case TimeRelevance::Upcoming: return "upcoming";
        case TimeRelevance::Ambient: return "ambient";
    }
    return "unknown";
}

/**
 * @brief Source-provided hints for post-processors.
 *
 * @details
 * Signals are opaque to the engine: it never ranks by them, it only passes
 * them through to post-processors and consumers.
 */
struct FeedItemSignals
{
    /// Source-assessed urgency in [0, 1].
    std::optional<double> urgency;
    std::optional<TimeRelevance> time_relevance;
};

/**
 * @brief A single item in the feed.
 *
 * @details
 * `id` must be unique within one feed. `type` discriminates the payload held
 * in `data`.
 */
struct FeedItem
{
    std::string id;
    std::string type;
    TimePoint timestamp{};
    Datum data{};
    std::optional<FeedItemSignals> signals{};
};

} // namespace feedweave
