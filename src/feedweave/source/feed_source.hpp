/**
 * @file feed_source.hpp
 * @brief IFeedSource, the unit of registration with the feed engine.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/context.hpp"
#include "feedweave/common/feed_item.hpp"
#include "feedweave/source/action.hpp"

namespace feedweave
{

/**
 * @brief Capabilities a source may provide, as bit flags.
 */
enum class SourceCapability : unsigned
{
    None = 0,
    FetchContext = 1u << 0,
    ContextUpdates = 1u << 1,
    FetchItems = 1u << 2,
    ItemsUpdates = 1u << 3,
    Actions = 1u << 4
};

constexpr SourceCapability operator|(SourceCapability a, SourceCapability b) noexcept
{
    return static_cast<SourceCapability>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

constexpr SourceCapability operator&(SourceCapability a, SourceCapability b) noexcept
{
    return static_cast<SourceCapability>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

/**
 * @brief Check whether a capability set contains every flag of `wanted`.
 */
constexpr bool has_capability(SourceCapability set, SourceCapability wanted) noexcept
{
    return wanted != SourceCapability::None && (set & wanted) == wanted;
}

/**
 * @brief Callback a source invokes to push a context change.
 */
using ContextUpdateCallback = std::function<void(const PartialContext& update)>;

/**
 * @brief Callback a source invokes when its items changed; carries no payload.
 */
using ItemsUpdateCallback = std::function<void()>;

/**
 * @brief Disposer returned by subscriptions. Must be called at most once.
 */
using Unsubscribe = std::function<void()>;

/**
 * @brief Interface for producers of context, feed items, and actions.
 *
 * @details
 * Sources form a dependency graph: a source names the ids of the sources it
 * depends on, and the engine runs dependencies first. A source may:
 * - provide context for later sources (FetchContext, ContextUpdates),
 * - produce feed items (FetchItems, ItemsUpdates),
 * - handle actions (Actions),
 * in any non-empty combination declared by capabilities(). The engine only
 * calls members whose capability is declared; the default implementations
 * throw FeedError(CapabilityNotSupported).
 *
 * @par Thread Safety
 * - fetch_context() and fetch_items() may be called from a worker thread when
 *   the engine runs with a source timeout or concurrent item collection. They
 *   are never called concurrently on the same source.
 * - Push callbacks may be invoked from any thread.
 *
 * @par Lifecycle
 * - Created by user code and registered with FeedEngine.
 * - Object lifetime managed via shared_ptr.
 */
class IFeedSource
{
public:
    virtual ~IFeedSource() = 0;

    /**
     * @brief Unique id of this source (reverse-domain convention).
     */
    virtual const std::string& id() const = 0;

    /**
     * @brief Ids of the sources this one depends on.
     */
    virtual std::vector<std::string> dependencies() const;

    /**
     * @brief The capabilities this source provides. Must not be None.
     */
    virtual SourceCapability capabilities() const = 0;

    /**
     * @brief Fetch context on demand.
     * @param context Context accumulated from the sources before this one.
     * @return Entries to merge, or std::nullopt for "no contribution".
     */
    virtual std::optional<PartialContext> fetch_context(const Context& context);

    /**
     * @brief Subscribe to context pushes.
     * @param callback Invoked zero or more times with pushed entries.
     * @param current Returns the engine's live context.
     * @return Disposer ending the subscription.
     */
    virtual Unsubscribe on_context_update(ContextUpdateCallback callback, ContextAccessor current);

    /**
     * @brief Fetch feed items on demand.
     * @param context The fully accumulated context.
     */
    virtual std::vector<FeedItem> fetch_items(const Context& context);

    /**
     * @brief Subscribe to "items changed" notifications.
     */
    virtual Unsubscribe on_items_update(ItemsUpdateCallback callback, ContextAccessor current);

    /**
     * @brief List the actions this source handles.
     */
    virtual ActionMap list_actions();

    /**
     * @brief Execute an action.
     * @throws UnknownActionError for ids not in list_actions().
     */
    virtual Datum execute_action(const std::string& action_id, const Datum& params);

protected:
    IFeedSource() = default;

private:
    IFeedSource(const IFeedSource&) = delete;
    IFeedSource(IFeedSource&&) = delete;
    IFeedSource& operator=(const IFeedSource&) = delete;
    IFeedSource& operator=(IFeedSource&&) = delete;
};

using SourcePtr = std::shared_ptr<IFeedSource>;

inline IFeedSource::~IFeedSource() = default;

} // namespace feedweave
