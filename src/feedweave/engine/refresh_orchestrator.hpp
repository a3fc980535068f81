/**
 * @file refresh_orchestrator.hpp
 * @brief RefreshOrchestrator walks a source graph to accumulate context and collect items.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/log.hpp"
#include "feedweave/engine/item_collector.hpp"
#include "feedweave/engine/source_call_runner.hpp"
#include "feedweave/graph/source_graph.hpp"

namespace feedweave
{

/**
 * @brief Configuration for graph walks.
 */
struct OrchestratorConfig
{
    /**
     * @brief Time budget per fetch_context()/fetch_items() call. Zero means unbounded.
     */
    std::chrono::milliseconds source_timeout{0};

    /**
     * @brief Whether item producers run concurrently.
     */
    bool concurrent_item_collection{false};
};

/**
 * @brief Context produced by a walk, with the failures met on the way.
 */
struct ContextPass
{
    Context context;
    std::vector<SourceError> errors;
};

/**
 * @brief Evaluation rules shared by the pull and reactive refresh paths.
 *
 * @details
 * The orchestrator holds no feed state; the engine passes in the graph and
 * the context to work from and keeps what comes back.
 *
 * @par Context production
 * fetch_context() calls are strictly sequential in topological order, since
 * later sources read what earlier ones wrote. Each call sees exactly the
 * entries merged before it. `std::nullopt` contributes nothing. A throwing
 * (or timed-out) source is recorded and the walk continues.
 *
 * @par Item production
 * Delegated to an IItemCollector chosen by the config.
 *
 * @par Thread Safety
 * - No internal synchronization; used from the engine's thread only.
 */
class RefreshOrchestrator
{
public:
    /**
     * @param runner Pool for bounded source calls. Must outlive the orchestrator.
     */
    RefreshOrchestrator(OrchestratorConfig config, Logger logger, SourceCallRunner& runner);

    /**
     * @brief Run fetch_context() on every source, in topological order.
     * @param graph The validated graph.
     * @param seed Starting context, normally empty with `time = now`.
     */
    ContextPass accumulate_context(const SourceGraph& graph, Context seed) const;

    /**
     * @brief Merge a pushed update into the live context.
     * @return The live context with the update merged and `time` set to `now`.
     */
    Context apply_push(const Context& live,
                       const PartialContext& update,
                       const std::string& origin_id,
                       TimePoint now) const;

    /**
     * @brief Re-run fetch_context() on the transitive dependents of `origin_id` only.
     * @param graph The validated graph.
     * @param live The live context, already carrying the pushed update.
     * @param origin_id Id of the source that pushed.
     */
    ContextPass propagate_context(const SourceGraph& graph,
                                  Context live,
                                  const std::string& origin_id) const;

    /**
     * @brief Collect items from every item producer with the final context.
     */
    CollectionResult collect_items(const SourceGraph& graph, const Context& context);

    const OrchestratorConfig& config() const noexcept
    {
        return m_config;
    }

private:
    /**
     * @brief Call one source's fetch_context() and merge its contribution into `context`.
     */
    void fetch_and_merge(const SourcePtr& source,
                         Context& context,
                         std::vector<SourceError>& errors) const;

    Context merge_checked(const Context& context,
                          const PartialContext& update,
                          const std::string& writer_id) const;

    OrchestratorConfig m_config;
    Logger m_logger;
    SourceCallRunner& m_runner;
    std::unique_ptr<IItemCollector> m_collector;
};

} // namespace feedweave
