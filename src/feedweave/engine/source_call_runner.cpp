#include "feedweave/engine/source_call_runner.hpp"

namespace feedweave
{

FeedError make_timeout_error(const std::string& source_id, std::chrono::milliseconds budget)
{
    return FeedError(
        FeedErrorCode::SourceTimeout,
        "Source \"" + source_id + "\" timed out after " + std::to_string(budget.count()) + "ms");
}

FeedError make_busy_error(const std::string& source_id)
{
    return FeedError(
        FeedErrorCode::SourceTimeout,
        "Source \"" + source_id + "\" is still running a previous call");
}

SourceCallRunner::SourceCallRunner(size_t thread_count)
    : m_pool{std::max<size_t>(thread_count, 1)}
{}

SourceCallRunner::~SourceCallRunner()
{
    join();
}

bool SourceCallRunner::in_flight(const SourcePtr& source) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight.count(source.get()) != 0;
}

void SourceCallRunner::join()
{
    m_pool.join();
}

bool SourceCallRunner::try_acquire(const IFeedSource* source)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight.insert(source).second;
}

void SourceCallRunner::release(const IFeedSource* source)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_in_flight.erase(source);
}

} // namespace feedweave
