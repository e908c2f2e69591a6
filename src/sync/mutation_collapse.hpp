#pragma once

#include <vector>

#include "common/models.hpp"

namespace engage {

// Folds a sequence of operations, in arrival order, into the fewest operations
// with the same end state.
//
// Attributes: the last set/remove on a name wins.
// Tag groups, per (group, tag):
//   - an add of an untouched tag followed by a remove cancels out entirely;
//   - a remove followed by an add is kept as remove-then-add so a later remove
//     still restores the removal;
//   - otherwise the net effect (added or removed) is kept.
// Output lists attribute operations in first-appearance order, then for each
// group (first-appearance order) one remove-from-group and one add-to-group.
std::vector<MutationOperation> collapseOperations(
    const std::vector<MutationOperation> &operations);

// Same as above for base + incoming. When baseSent is true the base has
// already been handed to the network, so its adds can no longer cancel out.
std::vector<MutationOperation> collapseOperations(
    const std::vector<MutationOperation> &base,
    const std::vector<MutationOperation> &incoming,
    bool baseSent);

} // namespace engage
