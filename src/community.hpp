#ifndef COMMUNITY_HPP
#define COMMUNITY_HPP

#include <vector>

#include "graph.hpp"

/*
    Label propagation
    Returns one label per vertex, renumbered from 1 without gaps.
*/

// Each neighbour votes for its label with weight 1
std::vector<int> detectCommunities(const ClauseGraph&, int maxIterations = 100, int seed = 42);
// Each neighbour votes for its label with the weight of the edge
std::vector<int> weightedDetectCommunities(const ClauseGraph&, int maxIterations = 100, int seed = 42);

int nbCommunities(const std::vector<int>& labels);
std::vector<int> communitySizes(const std::vector<int>& labels); // Sorted by decreasing size

#endif
