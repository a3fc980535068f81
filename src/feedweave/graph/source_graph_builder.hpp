/**
 * @file source_graph_builder.hpp
 * @brief SourceGraphBuilder validates registered sources into a SourceGraph.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/feed_errors.hpp"
#include "feedweave/graph/graph_diagnostics.hpp"
#include "feedweave/graph/source_graph.hpp"

namespace feedweave
{

/**
 * @brief Exception thrown when graph validation fails at build().
 *
 * @details
 * The error code is that of the first blocking diagnostic
 * (MissingDependency or CycleDetected); the message lists all of them.
 */
class GraphValidationError : public FeedError
{
public:
    GraphValidationError(FeedErrorCode code,
                         const std::string& msg,
                         std::shared_ptr<GraphDiagnostics> diagnostics)
        : FeedError(code, msg)
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<GraphDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<GraphDiagnostics> m_diagnostics;
};

/**
 * @brief Builder that turns a set of registered sources into a SourceGraph.
 *
 * @details
 * @par Usage
 * 1. Add sources via add_source(), in registration order.
 * 2. Call get_diagnostics() to inspect problems without throwing, or
 * 3. call build() to validate and produce a SourceGraph.
 *
 * @par Validation
 * - Every dependency must name an added source (MissingDependency).
 * - Dependencies must be acyclic (Cycle). Detection is a depth-first walk
 *   with three-colour marking; the reported path is in traversal order,
 *   e.g. `a → b → a`.
 *
 * @par Ordering
 * Sources are emitted in DFS post-order, visiting sources in registration
 * order and dependencies in declaration order. This is a topological order
 * with registration order as the tie-break.
 *
 * @par Thread Safety
 * - No internal synchronization.
 */
class SourceGraphBuilder
{
public:
    SourceGraphBuilder() = default;

    /**
     * @brief Add a source.
     * @throws FeedError(InvalidSource) if the source is null or a source with
     *         the same id was already added.
     */
    void add_source(const SourcePtr& source);

    /**
     * @brief Validate and produce a SourceGraph.
     * @throws GraphValidationError if the graph has validation errors.
     */
    SourceGraphPtr build() const;

    /**
     * @brief Get diagnostics without building.
     */
    std::shared_ptr<GraphDiagnostics> get_diagnostics() const;

    size_t source_count() const noexcept
    {
        return m_sources.size();
    }

private:
    struct Node
    {
        SourcePtr source;
        std::vector<std::string> dependencies;
    };

    /**
     * @brief Snapshot ids and dependency lists, read once per build.
     */
    std::vector<Node> snapshot_nodes() const;

    /**
     * @brief Validate the nodes and, when valid, fill `sorted_indices`.
     */
    std::shared_ptr<GraphDiagnostics> analyze(
        const std::vector<Node>& nodes,
        std::vector<size_t>& sorted_indices) const;

    std::vector<SourcePtr> m_sources{};
    std::unordered_map<std::string, size_t> m_index_of{};
};

} // namespace feedweave
