#include "feedweave/graph/source_graph_builder.hpp"
#include <sstream>

namespace feedweave
{

namespace
{

enum class VisitColor
{
    Unvisited,
    InProgress,
    Done
};

constexpr const char* kArrow = " → ";

std::string quoted(const std::string& id)
{
    return "\"" + id + "\"";
}

} // namespace

void SourceGraphBuilder::add_source(const SourcePtr& source)
{
    if (!source)
    {
        throw FeedError(FeedErrorCode::InvalidSource, "Cannot add a null source");
    }
    const std::string& id = source->id();
    if (m_index_of.count(id) != 0)
    {
        throw FeedError(FeedErrorCode::InvalidSource,
            "Source " + quoted(id) + " was added twice");
    }
    m_index_of.emplace(id, m_sources.size());
    m_sources.push_back(source);
}

std::vector<SourceGraphBuilder::Node> SourceGraphBuilder::snapshot_nodes() const
{
    std::vector<Node> nodes;
    nodes.reserve(m_sources.size());
    for (const auto& source : m_sources)
    {
        nodes.push_back(Node{source, source->dependencies()});
    }
    return nodes;
}

std::shared_ptr<GraphDiagnostics> SourceGraphBuilder::get_diagnostics() const
{
    std::vector<size_t> sorted_indices;
    return analyze(snapshot_nodes(), sorted_indices);
}

std::shared_ptr<GraphDiagnostics> SourceGraphBuilder::analyze(
    const std::vector<Node>& nodes,
    std::vector<size_t>& sorted_indices) const
{
    auto diagnostics = std::make_shared<GraphDiagnostics>();

    // Phase 1: every dependency must resolve
    for (const auto& node : nodes)
    {
        const std::string& id = node.source->id();
        std::unordered_set<std::string> listed;
        for (const auto& dep : node.dependencies)
        {
            if (!listed.insert(dep).second)
            {
                diagnostics->m_warnings.push_back(DiagnosticItem{
                    DiagnosticSeverity::Warning,
                    DiagnosticCategory::DuplicateDependency,
                    "Source " + quoted(id) + " lists dependency " + quoted(dep) + " more than once",
                    {id, dep}});
                continue;
            }
            if (m_index_of.count(dep) == 0)
            {
                diagnostics->m_errors.push_back(DiagnosticItem{
                    DiagnosticSeverity::Error,
                    DiagnosticCategory::MissingDependency,
                    "Source " + quoted(id) + " depends on " + quoted(dep) + " which is not registered",
                    {id, dep}});
            }
        }
    }

    // Phase 2: three-colour DFS for cycle detection and post-order sort.
    // Unresolved dependencies are skipped so a cycle among the resolved ones
    // is still reported alongside missing ones.
    std::vector<VisitColor> colors(nodes.size(), VisitColor::Unvisited);
    std::vector<size_t> path;
    sorted_indices.clear();
    sorted_indices.reserve(nodes.size());

    std::function<bool(size_t)> visit = [&](size_t idx) -> bool
    {
        if (colors[idx] == VisitColor::Done)
        {
            return true;
        }
        if (colors[idx] == VisitColor::InProgress)
        {
            auto start = std::find(path.begin(), path.end(), idx);
            DiagnosticItem item{
                DiagnosticSeverity::Error,
                DiagnosticCategory::Cycle,
                {},
                {}};
            for (auto it = start; it != path.end(); ++it)
            {
                item.involved_sources.push_back(nodes[*it].source->id());
            }
            item.involved_sources.push_back(nodes[idx].source->id());

            std::ostringstream oss;
            oss << "Circular dependency detected: ";
            for (size_t i = 0; i < item.involved_sources.size(); ++i)
            {
                if (i > 0)
                {
                    oss << kArrow;
                }
                oss << item.involved_sources[i];
            }
            item.message = oss.str();
            diagnostics->m_errors.push_back(std::move(item));
            return false;
        }

        colors[idx] = VisitColor::InProgress;
        path.push_back(idx);
        for (const auto& dep : nodes[idx].dependencies)
        {
            auto it = m_index_of.find(dep);
            if (it == m_index_of.end())
            {
                continue;
            }
            if (!visit(it->second))
            {
                return false;
            }
        }
        path.pop_back();
        colors[idx] = VisitColor::Done;
        sorted_indices.push_back(idx);
        return true;
    };

    for (size_t idx = 0; idx < nodes.size(); ++idx)
    {
        if (!visit(idx))
        {
            break;
        }
    }

    if (diagnostics->has_errors())
    {
        sorted_indices.clear();
    }
    return diagnostics;
}

SourceGraphPtr SourceGraphBuilder::build() const
{
    // Step 1: validate
    const auto nodes = snapshot_nodes();
    std::vector<size_t> sorted_indices;
    auto diagnostics = analyze(nodes, sorted_indices);
    if (diagnostics->has_errors())
    {
        std::ostringstream oss;
        oss << "Source graph validation failed with " << diagnostics->errors().size() << " error(s):\n";
        for (const auto& err : diagnostics->errors())
        {
            oss << "  - " << err.message << "\n";
        }
        FeedErrorCode code = diagnostics->errors().front().category == DiagnosticCategory::Cycle
            ? FeedErrorCode::CycleDetected
            : FeedErrorCode::MissingDependency;
        throw GraphValidationError(code, oss.str(), diagnostics);
    }

    // Step 2: lay out sources in topological order
    auto graph = std::make_shared<SourceGraph>();
    graph->sorted.reserve(nodes.size());
    for (size_t idx : sorted_indices)
    {
        const auto& source = nodes[idx].source;
        graph->position.emplace(source->id(), graph->sorted.size());
        graph->sorted.push_back(source);
        graph->by_id.emplace(source->id(), source);
    }

    // Step 3: reverse edges, in registration order of the dependents
    for (const auto& node : nodes)
    {
        std::unordered_set<std::string> listed;
        for (const auto& dep : node.dependencies)
        {
            if (listed.insert(dep).second)
            {
                graph->dependents[dep].push_back(node.source->id());
            }
        }
    }

    return graph;
}

} // namespace feedweave
