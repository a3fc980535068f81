/**
 * @file source_call_runner.hpp
 * @brief SourceCallRunner, a worker pool for time-bounded source calls.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/feed_errors.hpp"
#include "feedweave/source/feed_source.hpp"
#include <future>
#include <mutex>
#include <set>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace feedweave
{

using SteadyTimePoint = std::chrono::steady_clock::time_point;

/// Worker threads used when a config does not say otherwise.
constexpr size_t kDefaultWorkerThreads = 4;

/**
 * @brief Build the error recorded when a source misses its deadline.
 */
FeedError make_timeout_error(const std::string& source_id, std::chrono::milliseconds budget);

/**
 * @brief Build the error recorded when a source is skipped because its previous call is still running.
 */
FeedError make_busy_error(const std::string& source_id);

/**
 * @brief Wait for a launched call until `deadline`.
 * @return The call's result.
 * @throws FeedError(SourceTimeout) if the deadline passes first.
 * @throws Whatever the call itself threw.
 */
template <typename Result>
Result await_until(std::future<Result>& future,
                   SteadyTimePoint deadline,
                   const std::string& source_id,
                   std::chrono::milliseconds budget)
{
    if (future.wait_until(deadline) != std::future_status::ready)
    {
        throw make_timeout_error(source_id, budget);
    }
    return future.get();
}

/**
 * @brief Runs source calls on a fixed pool of worker threads.
 *
 * @details
 * A caller that stops waiting abandons the result, but the call itself keeps
 * its worker until it returns. While it runs, the source is marked in flight
 * and every further launch() for it fails fast with SourceTimeout, so no
 * source is ever called concurrently with itself and a hung source holds at
 * most one worker.
 *
 * The in-flight mark is cleared before the result is delivered, so a caller
 * that received a result may immediately launch the same source again.
 *
 * @par Thread Safety
 * - launch() and call() may be used from any thread.
 *
 * @par Lifecycle
 * - The destructor waits for every running call to return.
 */
class SourceCallRunner
{
public:
    explicit SourceCallRunner(size_t thread_count = kDefaultWorkerThreads);
    ~SourceCallRunner();

    SourceCallRunner(const SourceCallRunner&) = delete;
    SourceCallRunner& operator=(const SourceCallRunner&) = delete;

    /**
     * @brief Queue `fn`, a call into `source`, on the pool.
     * @return Future for the call's result.
     * @throws FeedError(SourceTimeout) if a previous call into `source` has not returned yet.
     */
    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> launch(const SourcePtr& source, Fn fn);

    /**
     * @brief Call `fn` with a time budget.
     * @details A zero or negative budget calls `fn` inline on the caller's thread.
     * @throws FeedError(SourceTimeout) if the budget runs out or the source is busy.
     */
    template <typename Fn>
    std::invoke_result_t<Fn> call(const SourcePtr& source, std::chrono::milliseconds budget, Fn fn);

    /**
     * @brief Whether a call into `source` is still running.
     */
    bool in_flight(const SourcePtr& source) const;

    /**
     * @brief Wait for every running and queued call to return.
     */
    void join();

private:
    bool try_acquire(const IFeedSource* source);
    void release(const IFeedSource* source);

    mutable std::mutex m_mutex;
    std::set<const IFeedSource*> m_in_flight{};

    // Last member: destroyed first, so workers are joined before the set goes away.
    boost::asio::thread_pool m_pool;
};

template <typename Fn>
std::future<std::invoke_result_t<Fn>> SourceCallRunner::launch(const SourcePtr& source, Fn fn)
{
    using Result = std::invoke_result_t<Fn>;

    const IFeedSource* key = source.get();
    if (!try_acquire(key))
    {
        throw make_busy_error(source->id());
    }

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    boost::asio::post(m_pool, [this, key, promise, fn]()
    {
        std::optional<Result> value;
        std::exception_ptr error;
        try
        {
            value.emplace(fn());
        }
        catch (...)
        {
            error = std::current_exception();
        }
        release(key);
        if (error)
        {
            promise->set_exception(error);
        }
        else
        {
            promise->set_value(std::move(*value));
        }
    });
    return future;
}

template <typename Fn>
std::invoke_result_t<Fn> SourceCallRunner::call(const SourcePtr& source,
                                                std::chrono::milliseconds budget,
                                                Fn fn)
{
    if (budget <= std::chrono::milliseconds::zero())
    {
        return fn();
    }
    auto future = launch(source, std::move(fn));
    return await_until(future, std::chrono::steady_clock::now() + budget, source->id(), budget);
}

} // namespace feedweave
