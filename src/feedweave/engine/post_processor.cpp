#include "feedweave/engine/post_processor.hpp"

namespace feedweave
{

namespace
{

const std::string kAnonymous = "anonymous";

} // namespace

ProcessorHandle PostProcessorPipeline::add(PostProcessor processor)
{
    ProcessorHandle handle = m_next_handle++;
    m_entries.push_back(Entry{handle, std::move(processor)});
    return handle;
}

bool PostProcessorPipeline::remove(ProcessorHandle handle)
{
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [handle](const Entry& entry) { return entry.handle == handle; });
    if (it == m_entries.end())
    {
        return false;
    }
    m_entries.erase(it);
    return true;
}

PipelineOutcome PostProcessorPipeline::run(std::vector<FeedItem> items,
                                           std::vector<SourceError> prior_errors) const
{
    PipelineOutcome outcome;
    outcome.items = std::move(items);
    outcome.errors = std::move(prior_errors);
    std::vector<ItemGroup> groups;

    for (const auto& entry : m_entries)
    {
        const PostProcessor& processor = entry.processor;
        try
        {
            if (!processor.fn)
            {
                throw std::logic_error("Post-processor has no function");
            }
            FeedEnhancement enhancement = processor.fn(outcome.items);

            // Build the next state aside; commit only once the processor succeeded.
            std::vector<FeedItem> next = outcome.items;
            next.insert(next.end(),
                std::make_move_iterator(enhancement.additional_items.begin()),
                std::make_move_iterator(enhancement.additional_items.end()));

            if (!enhancement.suppress.empty())
            {
                std::unordered_set<std::string> suppressed(
                    enhancement.suppress.begin(), enhancement.suppress.end());
                next.erase(
                    std::remove_if(next.begin(), next.end(),
                        [&suppressed](const FeedItem& item) { return suppressed.count(item.id) != 0; }),
                    next.end());
            }

            outcome.items = std::move(next);
            groups.insert(groups.end(),
                std::make_move_iterator(enhancement.grouped_items.begin()),
                std::make_move_iterator(enhancement.grouped_items.end()));
        }
        catch (...)
        {
            outcome.errors.push_back(make_source_error(
                processor.name.empty() ? kAnonymous : processor.name,
                std::current_exception()));
        }
    }

    auto surviving = sanitize_groups(std::move(groups), outcome.items);
    if (!surviving.empty())
    {
        outcome.grouped_items = std::move(surviving);
    }
    return outcome;
}

std::vector<ItemGroup> sanitize_groups(std::vector<ItemGroup> groups,
                                       const std::vector<FeedItem>& items)
{
    std::unordered_set<std::string> present;
    for (const auto& item : items)
    {
        present.insert(item.id);
    }

    std::vector<ItemGroup> result;
    for (auto& group : groups)
    {
        group.item_ids.erase(
            std::remove_if(group.item_ids.begin(), group.item_ids.end(),
                [&present](const std::string& id) { return present.count(id) == 0; }),
            group.item_ids.end());
        if (!group.item_ids.empty())
        {
            result.push_back(std::move(group));
        }
    }
    return result;
}

} // namespace feedweave
