/**
 * @file action_dispatcher.hpp
 * @brief ActionDispatcher routes actions to the source that owns them.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/engine/source_registry.hpp"
#include "feedweave/source/action.hpp"

namespace feedweave
{

/**
 * @brief Routes imperative commands to registered sources.
 *
 * @details
 * Dispatch is independent of the refresh cycle: executing an action changes
 * state held by the source but does not re-derive the feed. A source that
 * pushes a context or items update as a consequence triggers the reactive
 * path like any other push.
 *
 * @par Thread Safety
 * - No internal synchronization; used from the engine's thread only.
 */
class ActionDispatcher
{
public:
    explicit ActionDispatcher(const SourceRegistry& registry);

    /**
     * @brief List a source's actions.
     * @throws FeedError(SourceNotFound) if the source is not registered.
     * @throws FeedError(ActionIdMismatch) if a key differs from its definition's id.
     */
    ActionMap list_actions(const std::string& source_id) const;

    /**
     * @brief Execute an action on a source.
     * @return The source's result.
     * @throws FeedError(SourceNotFound), FeedError(ActionNotFound), or
     *         FeedError(InvalidActionInput) without calling the source.
     * @throws Whatever the source's execute_action() throws.
     */
    Datum execute_action(const std::string& source_id,
                         const std::string& action_id,
                         const Datum& params) const;

private:
    SourcePtr require_source(const std::string& source_id) const;

    const SourceRegistry& m_registry;
};

} // namespace feedweave
