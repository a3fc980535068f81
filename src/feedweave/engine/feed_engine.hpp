/**
 * @file feed_engine.hpp
 * @brief FeedEngine, the facade consumers use to register sources and receive feeds.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/log.hpp"
#include "feedweave/engine/action_dispatcher.hpp"
#include "feedweave/engine/clock.hpp"
#include "feedweave/engine/feed_cache.hpp"
#include "feedweave/engine/post_processor.hpp"
#include "feedweave/engine/refresh_orchestrator.hpp"
#include "feedweave/engine/refresh_timer.hpp"
#include "feedweave/engine/source_call_runner.hpp"
#include "feedweave/engine/source_registry.hpp"
#include <mutex>
#include <boost/asio/io_context.hpp>

namespace feedweave
{

/**
 * @brief Configuration for FeedEngine.
 */
struct FeedEngineConfig
{
    /**
     * @brief How long a result stays fresh, and the periodic refresh interval.
     * @details Values below kMinCacheTtl (including zero and negative) are raised to it.
     */
    std::chrono::milliseconds cache_ttl{kDefaultCacheTtl};

    /**
     * @brief Time budget per source call.
     * @details 0 means unbounded; calls then run inline on the engine thread.
     */
    std::chrono::milliseconds source_timeout{0};

    /**
     * @brief Whether item producers run concurrently under one shared deadline.
     */
    bool concurrent_item_collection{false};

    /**
     * @brief Worker threads for bounded source calls. Values below 1 are raised to 1.
     * @details Unused while source_timeout is 0 and collection is sequential.
     */
    size_t worker_threads{kDefaultWorkerThreads};

    /**
     * @brief Clock for context time and cache freshness. Null means SystemClock.
     */
    ClockPtr clock{};

    /**
     * @brief Where the engine logs. Null means make_default_log_sink().
     */
    LogSinkPtr log_sink{};

    /**
     * @brief Copy with the TTL floor applied and null members filled in.
     */
    FeedEngineConfig normalized() const;
};

/**
 * @brief Callback receiving each published feed.
 */
using FeedSubscriber = std::function<void(const FeedResultPtr& result)>;

/**
 * @brief Orchestrates sources, post-processors, the cache and the refresh timer.
 *
 * @details
 * The engine has two ways to produce a feed:
 * - Pull: refresh() walks the whole graph (also used by the periodic timer).
 * - Reactive: after start(), a context push re-runs only the pushing source's
 *   transitive dependents; an items push only re-collects items. Both then
 *   re-collect items from every producer, post-process, cache and notify.
 *
 * Every published result is cached and, while started, re-arms the periodic
 * timer to fire one TTL later.
 *
 * @par Thread Safety
 * - All members must be called from the thread running the io_context.
 * - Source push callbacks may be invoked from any thread; the work is posted
 *   onto the io_context.
 * - The ContextAccessor handed to sources may be called from any thread.
 *
 * @par Lifecycle
 * - Must be owned by a std::shared_ptr (see make_feed_engine()); push
 *   callbacks and timer handlers hold weak references to it.
 * - Callbacks from a subscription that has ended (stop(), unregistration or
 *   replacement of the source) are ignored.
 */
class FeedEngine : public std::enable_shared_from_this<FeedEngine>
{
public:
    FeedEngine(boost::asio::io_context& io, FeedEngineConfig config = {});
    ~FeedEngine();

    FeedEngine(const FeedEngine&) = delete;
    FeedEngine& operator=(const FeedEngine&) = delete;

    /**
     * @brief Register a source, replacing any source with the same id.
     * @throws FeedError(InvalidSource) if the source is null, has an empty id,
     *         or declares no capability.
     * @throws Whatever the source's subscription methods throw while started;
     *         the registration is then rolled back and a replaced source stays
     *         registered and subscribed.
     * @note While started, the source is subscribed immediately and a replaced
     *       source is unsubscribed once the new subscription is in place.
     */
    void register_source(SourcePtr source);

    /**
     * @brief Unregister a source.
     * @return True if the source was registered.
     */
    bool unregister_source(const std::string& source_id);

    /**
     * @brief Append a post-processor to the pipeline.
     * @return Handle for unregister_post_processor().
     */
    ProcessorHandle register_post_processor(PostProcessor processor);

    bool unregister_post_processor(ProcessorHandle handle);

    /**
     * @brief Pull refresh: walk the full graph and publish the result.
     * @return The published result.
     * @throws GraphValidationError if the registered sources do not form a valid graph.
     * @note Subscribers are notified only while started.
     */
    FeedResultPtr refresh();

    /**
     * @brief The cached result while fresh, otherwise nullptr.
     */
    FeedResultPtr last_feed() const;

    /**
     * @brief Receive every result published while started.
     * @return Disposer removing the subscriber.
     */
    Unsubscribe subscribe(FeedSubscriber subscriber);

    /**
     * @brief Validate the graph, subscribe to reactive sources and arm the timer.
     * @throws GraphValidationError if the graph is invalid; the engine stays stopped.
     * @note Idempotent.
     */
    void start();

    /**
     * @brief Cancel the timer and run every unsubscribe handle once.
     * @note Idempotent. The cache is kept.
     */
    void stop();

    bool is_started() const noexcept
    {
        return m_started;
    }

    /**
     * @brief Snapshot of the live context.
     */
    Context current_context() const;

    /**
     * @brief List a source's actions. See ActionDispatcher::list_actions().
     */
    ActionMap list_actions(const std::string& source_id) const;

    /**
     * @brief Execute a source's action. See ActionDispatcher::execute_action().
     */
    Datum execute_action(const std::string& source_id,
                         const std::string& action_id,
                         const Datum& params = {});

    size_t source_count() const noexcept
    {
        return m_registry.size();
    }

    /**
     * @brief The validated graph, rebuilt if sources changed since the last build.
     * @throws GraphValidationError if the graph is invalid.
     */
    SourceGraphPtr graph();

    const FeedEngineConfig& config() const noexcept
    {
        return m_config;
    }

private:
    /**
     * @brief Build the result, cache it, re-arm the timer and notify.
     */
    FeedResultPtr publish(Context context,
                          std::vector<FeedItem> items,
                          std::vector<SourceError> errors);

    void notify(const FeedResultPtr& result);

    struct SourceSubscription
    {
        uint64_t serial{0};
        std::vector<Unsubscribe> handles;
    };

    /**
     * @brief Subscribe to a source's pushes without recording the subscription.
     * @details On failure, handles already obtained are run before rethrowing.
     */
    SourceSubscription open_subscription(const SourcePtr& source);

    void subscribe_source(const SourcePtr& source);
    void unsubscribe_source(const std::string& source_id);
    void run_unsubscribe_handles(const std::string& source_id, std::vector<Unsubscribe>& handles);
    void remove_subscriber(size_t token);

    void arm_timer();
    void on_timer_fired();
    void on_context_push(uint64_t serial, const std::string& source_id, const PartialContext& update);
    void on_items_push(uint64_t serial, const std::string& source_id);

    /**
     * @brief Whether a pushed callback still belongs to the current subscription of `source_id`.
     */
    bool accepts_push(uint64_t serial, const std::string& source_id) const;

    void set_live_context(Context context);

    boost::asio::io_context& m_io;
    FeedEngineConfig m_config;
    Logger m_logger;

    SourceRegistry m_registry;
    ActionDispatcher m_dispatcher;
    SourceGraphPtr m_graph{};
    uint64_t m_graph_version{0};

    SourceCallRunner m_runner;
    RefreshOrchestrator m_orchestrator;
    PostProcessorPipeline m_pipeline;
    FeedCache m_cache;
    PeriodicRefreshTimer m_timer;

    mutable std::mutex m_context_mutex;
    Context m_live_context;

    std::vector<std::pair<size_t, FeedSubscriber>> m_subscribers{};
    size_t m_next_subscriber_token{1};

    /// Live subscriptions per source id; each handle runs exactly once.
    std::map<std::string, SourceSubscription> m_source_subscriptions{};
    uint64_t m_next_subscription_serial{1};

    bool m_started{false};
};

using FeedEnginePtr = std::shared_ptr<FeedEngine>;

/**
 * @brief Create a FeedEngine driven by `io`.
 */
FeedEnginePtr make_feed_engine(boost::asio::io_context& io, FeedEngineConfig config = {});

} // namespace feedweave
