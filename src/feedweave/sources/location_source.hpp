/**
 * @file location_source.hpp
 * @brief LocationSource, a push-only provider of the user's location.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/source/feed_source.hpp"
#include <deque>
#include <mutex>

namespace feedweave
{

/**
 * @brief Geographic coordinates with accuracy and timestamp.
 */
struct Location
{
    double lat{0.0};
    double lng{0.0};

    /// Accuracy in meters.
    double accuracy{0.0};

    TimePoint timestamp{};
};

/// Context key under which LocationSource publishes the latest location.
extern const ContextKey<Location> kLocationKey;

/**
 * @brief Options for LocationSource.
 */
struct LocationSourceConfig
{
    /// Number of locations kept in history. Values below 1 are raised to 1.
    size_t history_size{1};
};

/**
 * @brief Source publishing externally supplied locations as context.
 *
 * @details
 * LocationSource never queries a position itself. Locations arrive through
 * push_location() (e.g. from a GPS bridge) or through the `update-location`
 * action, and are forwarded to every context subscriber. fetch_context()
 * returns the most recent location, or std::nullopt before the first push.
 *
 * The source produces no feed items.
 *
 * @par Thread Safety
 * - All members are thread-safe. Subscribers are invoked on the pushing thread.
 */
class LocationSource : public IFeedSource
{
public:
    static constexpr const char* kDefaultId = "feedweave.location";
    static constexpr const char* kUpdateLocationAction = "update-location";

    explicit LocationSource(LocationSourceConfig config = {}, std::string id = kDefaultId);

    const std::string& id() const override
    {
        return m_id;
    }

    SourceCapability capabilities() const override;

    std::optional<PartialContext> fetch_context(const Context& context) override;
    Unsubscribe on_context_update(ContextUpdateCallback callback, ContextAccessor current) override;
    ActionMap list_actions() override;
    Datum execute_action(const std::string& action_id, const Datum& params) override;

    /**
     * @brief Record a location and notify every context subscriber.
     */
    void push_location(const Location& location);

    /**
     * @brief The most recent location, if any was pushed.
     */
    std::optional<Location> last_location() const;

    /**
     * @brief Retained locations, oldest first.
     */
    std::vector<Location> location_history() const;

    size_t history_size() const noexcept
    {
        return m_history_size;
    }

    size_t subscriber_count() const;

private:
    /// Shared with unsubscribe handles, which may outlive the source.
    struct Listeners
    {
        std::mutex mutex;
        std::map<size_t, ContextUpdateCallback> callbacks;
        size_t next_token{1};
    };

    std::string m_id;
    size_t m_history_size;

    mutable std::mutex m_mutex;
    std::deque<Location> m_history{};

    std::shared_ptr<Listeners> m_listeners;
};

/**
 * @brief Reject a Datum that does not hold a plausible Location.
 * @throws std::invalid_argument describing the problem.
 */
void validate_location_input(const Datum& params);

} // namespace feedweave
