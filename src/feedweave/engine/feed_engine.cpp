#include "feedweave/engine/feed_engine.hpp"
#include "feedweave/common/feed_errors.hpp"
#include <boost/asio/post.hpp>

namespace feedweave
{

// ============================================================================
// FeedEngineConfig
// ============================================================================

FeedEngineConfig FeedEngineConfig::normalized() const
{
    FeedEngineConfig result = *this;
    result.cache_ttl = clamp_cache_ttl(cache_ttl);
    if (result.source_timeout < std::chrono::milliseconds::zero())
    {
        result.source_timeout = std::chrono::milliseconds::zero();
    }
    result.worker_threads = std::max<size_t>(result.worker_threads, 1);
    if (!result.clock)
    {
        result.clock = std::make_shared<SystemClock>();
    }
    if (!result.log_sink)
    {
        result.log_sink = make_default_log_sink();
    }
    return result;
}

// ============================================================================
// Construction
// ============================================================================

FeedEngine::FeedEngine(boost::asio::io_context& io, FeedEngineConfig config)
    : m_io{io}
    , m_config{config.normalized()}
    , m_logger{m_config.log_sink, "engine"}
    , m_registry{}
    , m_dispatcher{m_registry}
    , m_runner{m_config.worker_threads}
    , m_orchestrator{
          OrchestratorConfig{m_config.source_timeout, m_config.concurrent_item_collection},
          m_logger.child("refresh"),
          m_runner}
    , m_pipeline{}
    , m_cache{m_config.cache_ttl, m_config.clock}
    , m_timer{io}
    , m_live_context{m_config.clock->now()}
{}

FeedEngine::~FeedEngine()
{
    m_timer.cancel();
    auto subscriptions = std::move(m_source_subscriptions);
    m_source_subscriptions.clear();
    for (auto& [source_id, subscription] : subscriptions)
    {
        run_unsubscribe_handles(source_id, subscription.handles);
    }

    // Abandoned calls may still be running against sources and the context.
    m_runner.join();
}

FeedEnginePtr make_feed_engine(boost::asio::io_context& io, FeedEngineConfig config)
{
    return std::make_shared<FeedEngine>(io, std::move(config));
}

// ============================================================================
// Registration
// ============================================================================

void FeedEngine::register_source(SourcePtr source)
{
    SourcePtr replaced = m_registry.insert(source);
    if (m_started)
    {
        SourceSubscription subscription;
        try
        {
            subscription = open_subscription(source);
        }
        catch (...)
        {
            if (replaced)
            {
                m_registry.insert(replaced);
            }
            else
            {
                m_registry.remove(source->id());
            }
            throw;
        }
        unsubscribe_source(source->id());
        if (!subscription.handles.empty())
        {
            m_source_subscriptions[source->id()] = std::move(subscription);
        }
    }
    if (replaced)
    {
        m_logger.debug("Source \"" + source->id() + "\" replaced");
    }
}

bool FeedEngine::unregister_source(const std::string& source_id)
{
    SourcePtr removed = m_registry.remove(source_id);
    if (!removed)
    {
        return false;
    }
    unsubscribe_source(source_id);
    return true;
}

ProcessorHandle FeedEngine::register_post_processor(PostProcessor processor)
{
    return m_pipeline.add(std::move(processor));
}

bool FeedEngine::unregister_post_processor(ProcessorHandle handle)
{
    return m_pipeline.remove(handle);
}

SourceGraphPtr FeedEngine::graph()
{
    if (!m_graph || m_graph_version != m_registry.version())
    {
        m_graph = m_registry.build_graph();
        m_graph_version = m_registry.version();
        m_logger.debug("Source graph rebuilt (sources=" + std::to_string(m_graph->source_count()) + ")");
    }
    return m_graph;
}

// ============================================================================
// Pull path
// ============================================================================

FeedResultPtr FeedEngine::refresh()
{
    SourceGraphPtr current = graph();

    ContextPass pass = m_orchestrator.accumulate_context(*current, Context{m_config.clock->now()});
    CollectionResult collected = m_orchestrator.collect_items(*current, pass.context);

    std::vector<SourceError> errors = std::move(pass.errors);
    errors.insert(errors.end(),
                  std::make_move_iterator(collected.errors.begin()),
                  std::make_move_iterator(collected.errors.end()));

    set_live_context(pass.context);
    return publish(std::move(pass.context), std::move(collected.items), std::move(errors));
}

FeedResultPtr FeedEngine::last_feed() const
{
    return m_cache.fresh();
}

FeedResultPtr FeedEngine::publish(Context context,
                                  std::vector<FeedItem> items,
                                  std::vector<SourceError> errors)
{
    PipelineOutcome outcome = m_pipeline.run(std::move(items), std::move(errors));

    auto result = std::make_shared<FeedResult>();
    result->context = std::move(context);
    result->items = std::move(outcome.items);
    result->errors = std::move(outcome.errors);
    result->grouped_items = std::move(outcome.grouped_items);

    FeedResultPtr published = result;
    m_cache.store(published);
    m_logger.debug(published->summary());

    if (m_started)
    {
        arm_timer();
        notify(published);
    }
    return published;
}

// ============================================================================
// Subscribers
// ============================================================================

Unsubscribe FeedEngine::subscribe(FeedSubscriber subscriber)
{
    const size_t token = m_next_subscriber_token++;
    m_subscribers.emplace_back(token, std::move(subscriber));

    std::weak_ptr<FeedEngine> weak = weak_from_this();
    return [weak, token]()
    {
        if (auto engine = weak.lock())
        {
            engine->remove_subscriber(token);
        }
    };
}

void FeedEngine::remove_subscriber(size_t token)
{
    auto it = std::find_if(m_subscribers.begin(), m_subscribers.end(),
        [token](const auto& entry) { return entry.first == token; });
    if (it != m_subscribers.end())
    {
        m_subscribers.erase(it);
    }
}

void FeedEngine::notify(const FeedResultPtr& result)
{
    // A subscriber may subscribe or unsubscribe from within its callback.
    const auto subscribers = m_subscribers;
    for (const auto& [token, subscriber] : subscribers)
    {
        if (!subscriber)
        {
            continue;
        }
        try
        {
            subscriber(result);
        }
        catch (const std::exception& e)
        {
            m_logger.warning("Subscriber " + std::to_string(token) + " failed: " + e.what());
        }
        catch (...)
        {
            m_logger.warning("Subscriber " + std::to_string(token) + " failed: Unknown exception");
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void FeedEngine::start()
{
    if (m_started)
    {
        return;
    }
    graph();

    m_started = true;
    try
    {
        for (const auto& source : m_registry.sources())
        {
            subscribe_source(source);
        }
    }
    catch (...)
    {
        stop();
        throw;
    }
    arm_timer();
    m_logger.info("Engine started (sources=" + std::to_string(m_registry.size()) + ")");
}

void FeedEngine::stop()
{
    if (!m_started)
    {
        return;
    }
    m_started = false;
    m_timer.cancel();

    std::vector<std::string> subscribed;
    for (const auto& entry : m_source_subscriptions)
    {
        subscribed.push_back(entry.first);
    }
    for (const auto& source_id : subscribed)
    {
        unsubscribe_source(source_id);
    }
    m_logger.info("Engine stopped");
}

FeedEngine::SourceSubscription FeedEngine::open_subscription(const SourcePtr& source)
{
    SourceSubscription subscription;
    const SourceCapability caps = source->capabilities();
    const bool wants_context = has_capability(caps, SourceCapability::ContextUpdates);
    const bool wants_items = has_capability(caps, SourceCapability::ItemsUpdates);
    if (!wants_context && !wants_items)
    {
        return subscription;
    }

    // Pushes are handled on the io_context, after the subscription is recorded.
    const uint64_t serial = m_next_subscription_serial++;
    const std::string source_id = source->id();
    std::weak_ptr<FeedEngine> weak = weak_from_this();
    boost::asio::io_context* io = &m_io;
    subscription.serial = serial;

    ContextAccessor accessor = [weak]() -> Context
    {
        auto engine = weak.lock();
        return engine ? engine->current_context() : Context{};
    };

    try
    {
        if (wants_context)
        {
            subscription.handles.push_back(source->on_context_update(
                [io, weak, serial, source_id](const PartialContext& update)
                {
                    boost::asio::post(*io, [weak, serial, source_id, update]()
                    {
                        if (auto engine = weak.lock())
                        {
                            engine->on_context_push(serial, source_id, update);
                        }
                    });
                },
                accessor));
        }
        if (wants_items)
        {
            subscription.handles.push_back(source->on_items_update(
                [io, weak, serial, source_id]()
                {
                    boost::asio::post(*io, [weak, serial, source_id]()
                    {
                        if (auto engine = weak.lock())
                        {
                            engine->on_items_push(serial, source_id);
                        }
                    });
                },
                accessor));
        }
    }
    catch (...)
    {
        run_unsubscribe_handles(source_id, subscription.handles);
        throw;
    }
    return subscription;
}

void FeedEngine::subscribe_source(const SourcePtr& source)
{
    SourceSubscription subscription = open_subscription(source);
    if (!subscription.handles.empty())
    {
        m_source_subscriptions[source->id()] = std::move(subscription);
    }
}

void FeedEngine::unsubscribe_source(const std::string& source_id)
{
    auto it = m_source_subscriptions.find(source_id);
    if (it == m_source_subscriptions.end())
    {
        return;
    }
    std::vector<Unsubscribe> handles = std::move(it->second.handles);
    m_source_subscriptions.erase(it);
    run_unsubscribe_handles(source_id, handles);
}

void FeedEngine::run_unsubscribe_handles(const std::string& source_id, std::vector<Unsubscribe>& handles)
{
    for (auto& handle : handles)
    {
        if (!handle)
        {
            continue;
        }
        try
        {
            handle();
        }
        catch (const std::exception& e)
        {
            m_logger.warning("Unsubscribe of source \"" + source_id + "\" failed: " + e.what());
        }
        catch (...)
        {
            m_logger.warning("Unsubscribe of source \"" + source_id + "\" failed: Unknown exception");
        }
    }
}

// ============================================================================
// Periodic refresh
// ============================================================================

void FeedEngine::arm_timer()
{
    std::weak_ptr<FeedEngine> weak = weak_from_this();
    m_timer.arm(m_config.cache_ttl, [weak]()
    {
        if (auto engine = weak.lock())
        {
            engine->on_timer_fired();
        }
    });
}

void FeedEngine::on_timer_fired()
{
    if (!m_started)
    {
        return;
    }
    try
    {
        refresh();
    }
    catch (const std::exception& e)
    {
        m_logger.warning(std::string("Periodic refresh failed: ") + e.what());
        if (m_started)
        {
            arm_timer();
        }
    }
}

// ============================================================================
// Reactive path
// ============================================================================

bool FeedEngine::accepts_push(uint64_t serial, const std::string& source_id) const
{
    if (!m_started)
    {
        return false;
    }
    auto it = m_source_subscriptions.find(source_id);
    return it != m_source_subscriptions.end() && it->second.serial == serial;
}

void FeedEngine::on_context_push(uint64_t serial, const std::string& source_id, const PartialContext& update)
{
    if (!accepts_push(serial, source_id))
    {
        m_logger.debug("Ignoring context push from ended subscription of \"" + source_id + "\"");
        return;
    }
    try
    {
        SourceGraphPtr current = graph();

        Context live = m_orchestrator.apply_push(current_context(), update, source_id,
                                                 m_config.clock->now());
        ContextPass pass = m_orchestrator.propagate_context(*current, std::move(live), source_id);
        for (const auto& error : pass.errors)
        {
            m_logger.warning("Context update from \"" + error.source_id + "\" failed: " + error.message);
        }
        CollectionResult collected = m_orchestrator.collect_items(*current, pass.context);

        std::vector<SourceError> errors = std::move(pass.errors);
        errors.insert(errors.end(),
                      std::make_move_iterator(collected.errors.begin()),
                      std::make_move_iterator(collected.errors.end()));

        set_live_context(pass.context);
        publish(std::move(pass.context), std::move(collected.items), std::move(errors));
    }
    catch (const std::exception& e)
    {
        m_logger.warning("Reactive refresh after context push from \"" + source_id + "\" failed: " + e.what());
    }
}

void FeedEngine::on_items_push(uint64_t serial, const std::string& source_id)
{
    if (!accepts_push(serial, source_id))
    {
        m_logger.debug("Ignoring items push from ended subscription of \"" + source_id + "\"");
        return;
    }
    try
    {
        SourceGraphPtr current = graph();
        Context live = current_context();
        CollectionResult collected = m_orchestrator.collect_items(*current, live);
        publish(std::move(live), std::move(collected.items), std::move(collected.errors));
    }
    catch (const std::exception& e)
    {
        m_logger.warning("Reactive refresh after items push from \"" + source_id + "\" failed: " + e.what());
    }
}

// ============================================================================
// Context and actions
// ============================================================================

Context FeedEngine::current_context() const
{
    std::lock_guard<std::mutex> lock(m_context_mutex);
    return m_live_context;
}

void FeedEngine::set_live_context(Context context)
{
    std::lock_guard<std::mutex> lock(m_context_mutex);
    m_live_context = std::move(context);
}

ActionMap FeedEngine::list_actions(const std::string& source_id) const
{
    return m_dispatcher.list_actions(source_id);
}

Datum FeedEngine::execute_action(const std::string& source_id,
                                 const std::string& action_id,
                                 const Datum& params)
{
    return m_dispatcher.execute_action(source_id, action_id, params);
}

} // namespace feedweave
