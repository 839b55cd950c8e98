#include "confcache/codec/problems.hh"

#include <nlohmann/json.hpp>

namespace confcache {

nlohmann::json problemsToJSON(const std::vector<PropertyProblem> & problems)
{
    auto list = nlohmann::json::array();
    for (auto & problem : problems)
        list.push_back({
            {"action", problem.action},
            {"description", problem.description},
            {"message", problem.message},
        });
    return {
        {"totalProblemCount", problems.size()},
        {"problems", std::move(list)},
    };
}

} // namespace confcache
