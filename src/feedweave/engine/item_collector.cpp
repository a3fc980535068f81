#include "feedweave/engine/item_collector.hpp"

namespace feedweave
{

namespace
{

bool produces_items(const SourcePtr& source)
{
    return has_capability(source->capabilities(), SourceCapability::FetchItems);
}

void append_items(std::vector<FeedItem>& out, std::vector<FeedItem>&& items)
{
    out.insert(out.end(),
        std::make_move_iterator(items.begin()),
        std::make_move_iterator(items.end()));
}

} // namespace

SequentialItemCollector::SequentialItemCollector(SourceCallRunner& runner, CollectorConfig config)
    : m_runner{runner}
    , m_config{std::move(config)}
{}

CollectionResult SequentialItemCollector::collect(const SourceGraph& graph, const Context& context)
{
    CollectionResult result;
    for (const auto& source : graph.sorted)
    {
        if (!produces_items(source))
        {
            continue;
        }
        try
        {
            append_items(result.items, m_runner.call(
                source,
                m_config.per_source_timeout,
                [source, context]() { return source->fetch_items(context); }));
        }
        catch (...)
        {
            result.errors.push_back(make_source_error(source->id(), std::current_exception()));
        }
    }
    return result;
}

ConcurrentItemCollector::ConcurrentItemCollector(SourceCallRunner& runner, CollectorConfig config)
    : m_runner{runner}
    , m_config{std::move(config)}
{}

CollectionResult ConcurrentItemCollector::collect(const SourceGraph& graph, const Context& context)
{
    struct Pending
    {
        SourcePtr source;
        std::future<std::vector<FeedItem>> future;
        std::exception_ptr launch_error;
    };

    // Launch every producer before waiting on any of them
    std::vector<Pending> pending;
    pending.reserve(graph.sorted.size());
    const bool bounded = m_config.per_source_timeout > std::chrono::milliseconds::zero();
    const auto deadline = std::chrono::steady_clock::now() + m_config.per_source_timeout;

    for (const auto& source : graph.sorted)
    {
        if (!produces_items(source))
        {
            continue;
        }
        Pending entry{source, {}, nullptr};
        try
        {
            entry.future = m_runner.launch(source, [source, context]() { return source->fetch_items(context); });
        }
        catch (...)
        {
            entry.launch_error = std::current_exception();
        }
        pending.push_back(std::move(entry));
    }

    // Gather in topological order, independent of completion order
    CollectionResult result;
    for (auto& entry : pending)
    {
        try
        {
            if (entry.launch_error)
            {
                std::rethrow_exception(entry.launch_error);
            }
            if (bounded)
            {
                append_items(result.items, await_until(
                    entry.future, deadline, entry.source->id(), m_config.per_source_timeout));
            }
            else
            {
                append_items(result.items, entry.future.get());
            }
        }
        catch (...)
        {
            result.errors.push_back(make_source_error(entry.source->id(), std::current_exception()));
        }
    }
    return result;
}

std::unique_ptr<IItemCollector> make_item_collector(SourceCallRunner& runner, const CollectorConfig& config)
{
    if (config.concurrent)
    {
        return std::make_unique<ConcurrentItemCollector>(runner, config);
    }
    return std::make_unique<SequentialItemCollector>(runner, config);
}

} // namespace feedweave
