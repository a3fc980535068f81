#include "feedweave/graph/source_graph.hpp"

namespace feedweave
{

std::vector<std::string> SourceGraph::transitive_dependents(const std::string& id) const
{
    std::unordered_set<std::string> seen;
    std::vector<std::string> stack{id};

    while (!stack.empty())
    {
        std::string current = std::move(stack.back());
        stack.pop_back();
        for (const auto& dependent : direct_dependents(current))
        {
            if (seen.insert(dependent).second)
            {
                stack.push_back(dependent);
            }
        }
    }

    std::vector<std::string> result(seen.begin(), seen.end());
    std::sort(result.begin(), result.end(),
        [this](const std::string& a, const std::string& b)
        {
            return position.at(a) < position.at(b);
        });
    return result;
}

} // namespace feedweave
