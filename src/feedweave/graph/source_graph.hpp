/**
 * @file source_graph.hpp
 * @brief Definition of the validated, topologically sorted source graph.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/source/feed_source.hpp"

namespace feedweave
{

/**
 * @brief Immutable execution plan produced by SourceGraphBuilder::build().
 *
 * @details
 * SourceGraph is a pure function of the registered sources: it holds them by
 * id plus an explicit adjacency structure, never live references from one
 * source to another. The engine keeps the current graph behind a
 * `shared_ptr<const SourceGraph>` and throws it away whenever registration
 * changes.
 *
 * @par Invariants
 * - `sorted` contains every registered source exactly once.
 * - For every source P and every id D in P's dependencies,
 *   `position.at(D) < position.at(P.id())`.
 * - `dependents[D]` lists the sources that directly declare D, in
 *   registration order.
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable; concurrent reads are safe.
 */
struct SourceGraph
{
    /**
     * @brief Sources keyed by id.
     */
    std::unordered_map<std::string, SourcePtr> by_id;

    /**
     * @brief Sources in topological order.
     *
     * @details
     * When several orders are valid, registration order breaks ties.
     */
    std::vector<SourcePtr> sorted;

    /**
     * @brief Reverse edges: id -> ids of sources that directly depend on it.
     */
    std::unordered_map<std::string, std::vector<std::string>> dependents;

    /**
     * @brief Index of each id in `sorted`.
     */
    std::unordered_map<std::string, size_t> position;

    /**
     * @brief Look up a source by id.
     * @return The source, or nullptr if not in the graph.
     */
    SourcePtr find(const std::string& id) const
    {
        auto it = by_id.find(id);
        return it == by_id.end() ? nullptr : it->second;
    }

    /**
     * @brief Get the ids that directly depend on `id`.
     */
    const std::vector<std::string>& direct_dependents(const std::string& id) const
    {
        static const std::vector<std::string> kNone;
        auto it = dependents.find(id);
        return it == dependents.end() ? kNone : it->second;
    }

    /**
     * @brief Collect every source that transitively depends on `id`.
     *
     * @details
     * Walks the reverse index depth-first with a seen-set, so a source
     * reachable along several paths (diamond dependencies) is listed once.
     * The origin itself is not included.
     *
     * @return Dependent ids in topological order.
     */
    std::vector<std::string> transitive_dependents(const std::string& id) const;

    size_t source_count() const noexcept
    {
        return sorted.size();
    }
};

using SourceGraphPtr = std::shared_ptr<const SourceGraph>;

} // namespace feedweave
