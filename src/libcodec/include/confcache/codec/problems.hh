#pragma once
///@file

#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "confcache/util/types.hh"

namespace confcache {

/**
 * Something that went wrong while writing a value, which did not stop
 * the value from being written.
 */
struct PropertyProblem
{
    /**
     * What was being done, e.g. "serialize".
     */
    std::string action;

    /**
     * The value concerned.
     */
    std::string description;

    std::string message;

    bool operator==(const PropertyProblem &) const = default;
};

/**
 * Render the problems of an encode pass as a JSON report.
 */
nlohmann::json problemsToJSON(const std::vector<PropertyProblem> & problems);

} // namespace confcache
