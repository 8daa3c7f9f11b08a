#pragma once

#include "DataFrame.h"
#include "Suggestion.h"

#include <string>

namespace TransformerActions {

/**
 * @brief True when `actionType` has an executor for `axis`.
 */
bool isSupported(const std::string& actionType, ActionAxis axis);

/**
 * @brief Applies one action to `frame` in place.
 * @details Callers replay on a private copy: on error `frame` may be partially
 *          modified and must be discarded.
 * @throws Sieve::ResolutionException for an unknown action type/axis pair or a
 *         column that is absent from `frame`.
 */
void apply(const ActionPayload& payload, DataFrame& frame);

} // namespace TransformerActions
