#include "feedweave/engine/feed_result.hpp"

namespace feedweave
{

SourceError make_source_error(std::string source_id, std::exception_ptr error)
{
    SourceError result{std::move(source_id), error, {}};
    if (!error)
    {
        result.message = "Unknown error";
        return result;
    }
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        result.message = e.what();
    }
    catch (...)
    {
        result.message = "Unknown exception";
    }
    return result;
}

const FeedItem* FeedResult::find_item(const std::string& id) const
{
    auto it = std::find_if(items.begin(), items.end(),
        [&id](const FeedItem& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

std::string FeedResult::summary() const
{
    std::string result = "Feed refreshed";
    result += " (items=" + std::to_string(items.size());
    result += ", groups=" + std::to_string(grouped_items ? grouped_items->size() : 0);
    result += ", errors=" + std::to_string(errors.size()) + ")";
    return result;
}

} // namespace feedweave
