/**
 * @file feed_result.hpp
 * @brief Definition of FeedResult, produced once per refresh.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/context.hpp"
#include "feedweave/common/feed_item.hpp"

namespace feedweave
{

/**
 * @brief A failure attributed to one source or post-processor.
 */
struct SourceError
{
    /// Id of the failing source, or the name of the failing post-processor.
    std::string source_id;

    /// The captured exception.
    std::exception_ptr error;

    /// `what()` of the captured exception, or "Unknown exception".
    std::string message;
};

/**
 * @brief Build a SourceError from a captured exception.
 */
SourceError make_source_error(std::string source_id, std::exception_ptr error);

/**
 * @brief Items to present together with a summary.
 */
struct ItemGroup
{
    std::vector<std::string> item_ids;
    std::string summary;
};

/**
 * @brief Result of one refresh, pull or reactive.
 *
 * @details
 * FeedResult is the unit stored in the cache and delivered to subscribers. It
 * is shared immutably through FeedResultPtr.
 *
 * A refresh never fails wholesale because a source is broken: `items` is the
 * best-effort feed and `errors` lists every source or post-processor that
 * failed along the way.
 */
struct FeedResult
{
    /**
     * @brief The context the items were produced from.
     */
    Context context;

    /**
     * @brief Final items, after post-processing.
     */
    std::vector<FeedItem> items;

    /**
     * @brief Failures collected during the refresh, in occurrence order.
     */
    std::vector<SourceError> errors;

    /**
     * @brief Groups produced by post-processors.
     * @details Absent when no group survived sanitization.
     */
    std::optional<std::vector<ItemGroup>> grouped_items;

    bool has_errors() const noexcept
    {
        return !errors.empty();
    }

    /**
     * @brief Find an item by id, or nullptr.
     */
    const FeedItem* find_item(const std::string& id) const;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;
};

using FeedResultPtr = std::shared_ptr<const FeedResult>;

} // namespace feedweave
