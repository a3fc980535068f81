#include "feedweave/common/context.hpp"

namespace feedweave
{

Context Context::with_time(TimePoint time) const
{
    Context result{*this};
    result.m_time = time;
    return result;
}

Context Context::merged(const PartialContext& update, const std::string& writer_id) const
{
    Context result{*this};
    for (const auto& [key, value] : update.entries())
    {
        result.m_entries[key] = value;
        result.m_writers[key] = writer_id;
    }
    return result;
}

std::vector<std::string> Context::colliding_keys(const PartialContext& update,
                                                 const std::string& writer_id) const
{
    std::vector<std::string> result;
    for (const auto& entry : update.entries())
    {
        auto it = m_writers.find(entry.first);
        if (it != m_writers.end() && it->second != writer_id)
        {
            result.push_back(entry.first);
        }
    }
    return result;
}

const Datum* Context::find(const std::string& key) const
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
    {
        return nullptr;
    }
    return &it->second;
}

std::string Context::writer_of(const std::string& key) const
{
    auto it = m_writers.find(key);
    return it == m_writers.end() ? std::string{} : it->second;
}

std::vector<std::string> Context::keys() const
{
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace feedweave
