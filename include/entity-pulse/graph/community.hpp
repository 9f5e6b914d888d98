#pragma once

#include "entity-pulse/graph/entity_graph.hpp"

#include <string>
#include <vector>

namespace entitypulse::graph {

using Community = std::vector<std::string>;

/**
 * @brief Clauset-Newman-Moore greedy modularity maximisation on the unweighted, undirected view.
 *
 * Starts from singletons and repeatedly merges the pair of connected communities with the
 * largest modularity gain while that gain is positive.
 *
 * @return Communities with members sorted by name, ordered by size (largest first) then by
 *         first member. Isolated nodes form singleton communities.
 */
std::vector<Community> greedyModularityCommunities(const EntityGraph &graph);

/// Newman modularity Q of a partition of the graph's nodes (unweighted, undirected view).
double modularity(const EntityGraph &graph, const std::vector<Community> &communities);

} // namespace entitypulse::graph
