/**
 * @file action.hpp
 * @brief Definitions of actions a feed source can perform.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/datum.hpp"

namespace feedweave
{

/**
 * @brief Validator for action input; throws to reject the parameters.
 */
using ActionInputValidator = std::function<void(const Datum& params)>;

/**
 * @brief Describes an action a source can perform.
 *
 * @details
 * Action ids use verb-noun kebab-case (e.g. "update-location"). Combined with
 * the source's id they form a globally unique name:
 * `<source_id>/<action_id>`.
 */
struct ActionDefinition
{
    std::string id;

    /// Optional longer description.
    std::string description;

    /// Optional input check run by the dispatcher before the source is called.
    ActionInputValidator validate_input;
};

/**
 * @brief Actions of one source, keyed by action id.
 * @note Every key must equal the `id` of its definition.
 */
using ActionMap = std::map<std::string, ActionDefinition>;

} // namespace feedweave
