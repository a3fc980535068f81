#include "feedweave/engine/source_registry.hpp"
#include "feedweave/common/feed_errors.hpp"
#include "feedweave/graph/source_graph_builder.hpp"

namespace feedweave
{

SourcePtr SourceRegistry::insert(SourcePtr source)
{
    if (!source)
    {
        throw FeedError(FeedErrorCode::InvalidSource, "Cannot register a null source");
    }
    if (source->id().empty())
    {
        throw FeedError(FeedErrorCode::InvalidSource, "Cannot register a source with an empty id");
    }
    if (source->capabilities() == SourceCapability::None)
    {
        throw FeedError(FeedErrorCode::InvalidSource,
            "Source \"" + source->id() + "\" declares no capability");
    }

    ++m_version;
    auto it = std::find_if(m_sources.begin(), m_sources.end(),
        [&source](const SourcePtr& existing) { return existing->id() == source->id(); });
    if (it != m_sources.end())
    {
        SourcePtr replaced = std::move(*it);
        *it = std::move(source);
        return replaced;
    }
    m_sources.push_back(std::move(source));
    return nullptr;
}

SourcePtr SourceRegistry::remove(const std::string& id)
{
    auto it = std::find_if(m_sources.begin(), m_sources.end(),
        [&id](const SourcePtr& existing) { return existing->id() == id; });
    if (it == m_sources.end())
    {
        return nullptr;
    }
    SourcePtr removed = std::move(*it);
    m_sources.erase(it);
    ++m_version;
    return removed;
}

SourcePtr SourceRegistry::find(const std::string& id) const
{
    auto it = std::find_if(m_sources.begin(), m_sources.end(),
        [&id](const SourcePtr& existing) { return existing->id() == id; });
    return it == m_sources.end() ? nullptr : *it;
}

SourceGraphPtr SourceRegistry::build_graph() const
{
    SourceGraphBuilder builder;
    for (const auto& source : m_sources)
    {
        builder.add_source(source);
    }
    return builder.build();
}

} // namespace feedweave
