/**
 * @file item_collector.hpp
 * @brief IItemCollector interface and CollectorConfig.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/engine/feed_result.hpp"
#include "feedweave/engine/source_call_runner.hpp"
#include "feedweave/graph/source_graph.hpp"

namespace feedweave
{

/**
 * @brief Configuration for item collection.
 */
struct CollectorConfig
{
    /**
     * @brief Time budget per source.
     * @details Zero means unbounded. A source that misses its budget is
     *          recorded as a SourceTimeout error; the others still complete.
     */
    std::chrono::milliseconds per_source_timeout{0};

    /**
     * @brief Whether to call all item producers at once.
     * @details If true, every fetch_items() call is queued on the runner's
     *          pool at once and all of them race one shared deadline.
     */
    bool concurrent{false};
};

/**
 * @brief Items and errors gathered from all item producers.
 */
struct CollectionResult
{
    std::vector<FeedItem> items;
    std::vector<SourceError> errors;
};

/**
 * @brief Interface for collecting items from every source of a graph.
 *
 * @details
 * Every implementation calls fetch_items() on each source declaring
 * FetchItems, with the same final context, and returns the items ordered by
 * the source's topological position, then by the source's own emission
 * order, whatever the actual completion order was. A source that throws
 * contributes one SourceError and no items.
 */
class IItemCollector
{
public:
    virtual ~IItemCollector() = default;

    /**
     * @brief Collect items.
     * @param graph The validated source graph.
     * @param context The fully accumulated context.
     */
    virtual CollectionResult collect(const SourceGraph& graph, const Context& context) = 0;
};

/**
 * @brief Calls item producers one after another, in topological order.
 */
class SequentialItemCollector : public IItemCollector
{
public:
    /**
     * @param runner Pool for bounded calls. Must outlive the collector.
     */
    SequentialItemCollector(SourceCallRunner& runner, CollectorConfig config = {});

    CollectionResult collect(const SourceGraph& graph, const Context& context) override;

private:
    SourceCallRunner& m_runner;
    CollectorConfig m_config;
};

/**
 * @brief Fans item producers out on worker threads under one shared deadline.
 *
 * @details
 * Sources run concurrently, up to the runner's thread count. A source still
 * running at the deadline is reported as timed out and its result is
 * discarded once it returns.
 */
class ConcurrentItemCollector : public IItemCollector
{
public:
    /**
     * @param runner Pool running the producers. Must outlive the collector.
     */
    ConcurrentItemCollector(SourceCallRunner& runner, CollectorConfig config = {});

    CollectionResult collect(const SourceGraph& graph, const Context& context) override;

private:
    SourceCallRunner& m_runner;
    CollectorConfig m_config;
};

/**
 * @brief Factory function choosing the collector matching the config.
 */
std::unique_ptr<IItemCollector> make_item_collector(SourceCallRunner& runner, const CollectorConfig& config);

} // namespace feedweave
