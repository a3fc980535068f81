/**
 * @file source_registry.hpp
 * @brief Ordered registry of feed sources keyed by id.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/graph/source_graph.hpp"

namespace feedweave
{

/**
 * @brief The set of registered sources, in registration order.
 *
 * @details
 * Registering an id that is already present replaces the earlier source in
 * its original position (last write wins). Every change bumps version(), which
 * the engine uses to know its memoized graph is stale.
 *
 * @par Thread Safety
 * - No internal synchronization; owned by one engine.
 */
class SourceRegistry
{
public:
    /**
     * @brief Register or replace a source.
     * @return The replaced source, or nullptr if the id was new.
     * @throws FeedError(InvalidSource) if the source is null, has an empty id,
     *         or declares no capability.
     */
    SourcePtr insert(SourcePtr source);

    /**
     * @brief Remove a source by id.
     * @return The removed source, or nullptr if the id was not registered.
     */
    SourcePtr remove(const std::string& id);

    /**
     * @brief Look up a source by id, or nullptr.
     */
    SourcePtr find(const std::string& id) const;

    bool contains(const std::string& id) const
    {
        return find(id) != nullptr;
    }

    const std::vector<SourcePtr>& sources() const noexcept
    {
        return m_sources;
    }

    size_t size() const noexcept
    {
        return m_sources.size();
    }

    /**
     * @brief Counter incremented on every insert or successful remove.
     */
    uint64_t version() const noexcept
    {
        return m_version;
    }

    /**
     * @brief Validate the registered sources into a graph.
     * @throws GraphValidationError on a missing dependency or cycle.
     */
    SourceGraphPtr build_graph() const;

private:
    std::vector<SourcePtr> m_sources{};
    uint64_t m_version{0};
};

} // namespace feedweave
