#include "feedweave/engine/action_dispatcher.hpp"
#include "feedweave/common/feed_errors.hpp"

namespace feedweave
{

ActionDispatcher::ActionDispatcher(const SourceRegistry& registry)
    : m_registry{registry}
{}

SourcePtr ActionDispatcher::require_source(const std::string& source_id) const
{
    SourcePtr source = m_registry.find(source_id);
    if (!source)
    {
        throw FeedError(FeedErrorCode::SourceNotFound, "Source not found: " + source_id);
    }
    return source;
}

ActionMap ActionDispatcher::list_actions(const std::string& source_id) const
{
    SourcePtr source = require_source(source_id);
    if (!has_capability(source->capabilities(), SourceCapability::Actions))
    {
        return {};
    }

    ActionMap actions = source->list_actions();
    for (const auto& [key, definition] : actions)
    {
        if (key != definition.id)
        {
            throw FeedError(FeedErrorCode::ActionIdMismatch,
                "Action ID mismatch on source \"" + source_id + "\": key \"" + key +
                "\" != definition.id \"" + definition.id + "\"");
        }
    }
    return actions;
}

Datum ActionDispatcher::execute_action(const std::string& source_id,
                                       const std::string& action_id,
                                       const Datum& params) const
{
    ActionMap actions = list_actions(source_id);
    auto it = actions.find(action_id);
    if (it == actions.end())
    {
        throw FeedError(FeedErrorCode::ActionNotFound,
            "Action \"" + action_id + "\" not found on source \"" + source_id + "\"");
    }

    if (it->second.validate_input)
    {
        try
        {
            it->second.validate_input(params);
        }
        catch (const std::exception& e)
        {
            throw FeedError(FeedErrorCode::InvalidActionInput,
                "Invalid input for action \"" + action_id + "\" on source \"" + source_id +
                "\": " + e.what());
        }
    }

    return require_source(source_id)->execute_action(action_id, params);
}

} // namespace feedweave
