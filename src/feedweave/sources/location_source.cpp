#include "feedweave/sources/location_source.hpp"
#include "feedweave/common/feed_errors.hpp"
#include <cmath>

namespace feedweave
{

const ContextKey<Location> kLocationKey{"location"};

void validate_location_input(const Datum& params)
{
    const Location* location = params.try_as<Location>();
    if (!location)
    {
        throw std::invalid_argument("expected a Location");
    }
    if (!std::isfinite(location->lat) || location->lat < -90.0 || location->lat > 90.0)
    {
        throw std::invalid_argument("latitude out of range: " + std::to_string(location->lat));
    }
    if (!std::isfinite(location->lng) || location->lng < -180.0 || location->lng > 180.0)
    {
        throw std::invalid_argument("longitude out of range: " + std::to_string(location->lng));
    }
    if (!std::isfinite(location->accuracy) || location->accuracy < 0.0)
    {
        throw std::invalid_argument("accuracy must be a non-negative number");
    }
}

LocationSource::LocationSource(LocationSourceConfig config, std::string id)
    : m_id{std::move(id)}
    , m_history_size{std::max<size_t>(config.history_size, 1)}
    , m_listeners{std::make_shared<Listeners>()}
{}

SourceCapability LocationSource::capabilities() const
{
    return SourceCapability::FetchContext
        | SourceCapability::ContextUpdates
        | SourceCapability::Actions;
}

std::optional<PartialContext> LocationSource::fetch_context(const Context&)
{
    std::optional<Location> last = last_location();
    if (!last)
    {
        return std::nullopt;
    }
    PartialContext update;
    update.set(kLocationKey, *last);
    return update;
}

Unsubscribe LocationSource::on_context_update(ContextUpdateCallback callback, ContextAccessor)
{
    size_t token = 0;
    {
        std::lock_guard<std::mutex> lock(m_listeners->mutex);
        token = m_listeners->next_token++;
        m_listeners->callbacks.emplace(token, std::move(callback));
    }

    std::weak_ptr<Listeners> weak = m_listeners;
    return [weak, token]()
    {
        if (auto listeners = weak.lock())
        {
            std::lock_guard<std::mutex> lock(listeners->mutex);
            listeners->callbacks.erase(token);
        }
    };
}

ActionMap LocationSource::list_actions()
{
    ActionMap actions;
    actions.emplace(kUpdateLocationAction, ActionDefinition{
        kUpdateLocationAction,
        "Record a new location and push it to subscribers",
        validate_location_input});
    return actions;
}

Datum LocationSource::execute_action(const std::string& action_id, const Datum& params)
{
    if (action_id != kUpdateLocationAction)
    {
        throw UnknownActionError(action_id);
    }
    validate_location_input(params);
    push_location(params.as<Location>());
    return Datum{};
}

void LocationSource::push_location(const Location& location)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.push_back(location);
        while (m_history.size() > m_history_size)
        {
            m_history.pop_front();
        }
    }

    PartialContext update;
    update.set(kLocationKey, location);

    // Callbacks run without the lock, so they may unsubscribe.
    std::vector<ContextUpdateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_listeners->mutex);
        for (const auto& entry : m_listeners->callbacks)
        {
            callbacks.push_back(entry.second);
        }
    }
    for (const auto& callback : callbacks)
    {
        if (callback)
        {
            callback(update);
        }
    }
}

std::optional<Location> LocationSource::last_location() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_history.empty())
    {
        return std::nullopt;
    }
    return m_history.back();
}

std::vector<Location> LocationSource::location_history() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<Location>(m_history.begin(), m_history.end());
}

size_t LocationSource::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(m_listeners->mutex);
    return m_listeners->callbacks.size();
}

} // namespace feedweave
