#pragma once

#include "Suggestion.h"

#include <vector>

namespace ActionTitles {

/**
 * @brief Fills empty titles and messages from each action's payload.
 * @details Existing text is kept, so repeated calls return the same list. The
 *          payload itself is never modified.
 */
std::vector<Action> fillTitles(std::vector<Action> actions);

std::string describe(const ActionPayload& payload);

} // namespace ActionTitles
