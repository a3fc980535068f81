/**
 * @file post_processor.hpp
 * @brief Post-processors and the pipeline that applies them after each refresh.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/feed_item.hpp"
#include "feedweave/engine/feed_result.hpp"

namespace feedweave
{

/**
 * @brief Directives a post-processor returns for the current item list.
 */
struct FeedEnhancement
{
    /// New items appended to the feed.
    std::vector<FeedItem> additional_items;

    /// Ids of items to remove from the feed.
    std::vector<std::string> suppress;

    /// Groups of items to present together.
    std::vector<ItemGroup> grouped_items;
};

/**
 * @brief A pure transform over the collected items.
 * @throws Any exception to indicate failure; the processor's effect is then discarded.
 */
using PostProcessorFn = std::function<FeedEnhancement(const std::vector<FeedItem>& items)>;

/**
 * @brief A named post-processor. The name attributes errors.
 */
struct PostProcessor
{
    std::string name;
    PostProcessorFn fn;
};

/**
 * @brief Handle identifying a registered post-processor.
 */
using ProcessorHandle = size_t;

/**
 * @brief Result of running the pipeline.
 */
struct PipelineOutcome
{
    std::vector<FeedItem> items;
    std::optional<std::vector<ItemGroup>> grouped_items;
    std::vector<SourceError> errors;
};

/**
 * @brief Ordered chain of post-processors.
 *
 * @details
 * Processors run strictly in registration order. Each one sees the item list
 * as left by every earlier processor in the same pass:
 * - `additional_items` are appended,
 * - `suppress` removes items by id,
 * - `grouped_items` accumulate into one flat list across all processors.
 *
 * A processor that throws is recorded as a SourceError named after it
 * (`anonymous` if the name is empty). Its effect on items and groups is
 * discarded and the next processor runs.
 *
 * After the last processor, group member ids that no longer exist in the
 * item list are dropped, and groups left empty are dropped. When no group
 * survives, `grouped_items` is std::nullopt.
 *
 * @par Thread Safety
 * - No internal synchronization.
 */
class PostProcessorPipeline
{
public:
    /**
     * @brief Append a processor.
     * @return Handle for remove().
     */
    ProcessorHandle add(PostProcessor processor);

    /**
     * @brief Remove a processor.
     * @return True if the handle was registered.
     */
    bool remove(ProcessorHandle handle);

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    /**
     * @brief Apply all processors.
     * @param items Items collected from sources.
     * @param prior_errors Errors already recorded during the refresh.
     * @return Final items, surviving groups, and prior plus processor errors.
     */
    PipelineOutcome run(std::vector<FeedItem> items, std::vector<SourceError> prior_errors) const;

private:
    struct Entry
    {
        ProcessorHandle handle;
        PostProcessor processor;
    };

    std::vector<Entry> m_entries{};
    ProcessorHandle m_next_handle{1};
};

/**
 * @brief Drop group members that are not in `items`, then drop empty groups.
 */
std::vector<ItemGroup> sanitize_groups(std::vector<ItemGroup> groups,
                                       const std::vector<FeedItem>& items);

} // namespace feedweave
