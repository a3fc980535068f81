#include "feedweave/source/feed_source.hpp"
#include "feedweave/common/feed_errors.hpp"

namespace feedweave
{

namespace
{

[[noreturn]] void throw_not_supported(const IFeedSource& source, const char* member)
{
    throw FeedError(
        FeedErrorCode::CapabilityNotSupported,
        "Source \"" + source.id() + "\" does not implement " + member);
}

} // namespace

std::vector<std::string> IFeedSource::dependencies() const
{
    return {};
}

std::optional<PartialContext> IFeedSource::fetch_context(const Context&)
{
    throw_not_supported(*this, "fetch_context");
}

Unsubscribe IFeedSource::on_context_update(ContextUpdateCallback, ContextAccessor)
{
    throw_not_supported(*this, "on_context_update");
}

std::vector<FeedItem> IFeedSource::fetch_items(const Context&)
{
    throw_not_supported(*this, "fetch_items");
}

Unsubscribe IFeedSource::on_items_update(ItemsUpdateCallback, ContextAccessor)
{
    throw_not_supported(*this, "on_items_update");
}

ActionMap IFeedSource::list_actions()
{
    return {};
}

Datum IFeedSource::execute_action(const std::string& action_id, const Datum&)
{
    throw UnknownActionError(action_id);
}

} // namespace feedweave
