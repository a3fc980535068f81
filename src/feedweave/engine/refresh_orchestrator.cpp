#include "feedweave/engine/refresh_orchestrator.hpp"

namespace feedweave
{

RefreshOrchestrator::RefreshOrchestrator(OrchestratorConfig config, Logger logger, SourceCallRunner& runner)
    : m_config{std::move(config)}
    , m_logger{std::move(logger)}
    , m_runner{runner}
    , m_collector{make_item_collector(m_runner, CollectorConfig{
          m_config.source_timeout,
          m_config.concurrent_item_collection})}
{}

ContextPass RefreshOrchestrator::accumulate_context(const SourceGraph& graph, Context seed) const
{
    ContextPass pass{std::move(seed), {}};
    for (const auto& source : graph.sorted)
    {
        fetch_and_merge(source, pass.context, pass.errors);
    }
    return pass;
}

Context RefreshOrchestrator::apply_push(const Context& live,
                                        const PartialContext& update,
                                        const std::string& origin_id,
                                        TimePoint now) const
{
    return merge_checked(live, update, origin_id).with_time(now);
}

ContextPass RefreshOrchestrator::propagate_context(const SourceGraph& graph,
                                                   Context live,
                                                   const std::string& origin_id) const
{
    ContextPass pass{std::move(live), {}};
    for (const auto& id : graph.transitive_dependents(origin_id))
    {
        fetch_and_merge(graph.find(id), pass.context, pass.errors);
    }
    return pass;
}

CollectionResult RefreshOrchestrator::collect_items(const SourceGraph& graph, const Context& context)
{
    return m_collector->collect(graph, context);
}

void RefreshOrchestrator::fetch_and_merge(const SourcePtr& source,
                                          Context& context,
                                          std::vector<SourceError>& errors) const
{
    if (!source || !has_capability(source->capabilities(), SourceCapability::FetchContext))
    {
        return;
    }
    try
    {
        const Context snapshot = context;
        std::optional<PartialContext> update = m_runner.call(
            source,
            m_config.source_timeout,
            [source, snapshot]() { return source->fetch_context(snapshot); });
        if (update && !update->empty())
        {
            context = merge_checked(context, *update, source->id());
        }
    }
    catch (...)
    {
        errors.push_back(make_source_error(source->id(), std::current_exception()));
    }
}

Context RefreshOrchestrator::merge_checked(const Context& context,
                                           const PartialContext& update,
                                           const std::string& writer_id) const
{
    for (const auto& key : context.colliding_keys(update, writer_id))
    {
        m_logger.warning("Context key \"" + key + "\" written by \"" + writer_id +
                         "\" overwrites the value from \"" + context.writer_of(key) + "\"");
    }
    return context.merged(update, writer_id);
}

} // namespace feedweave
