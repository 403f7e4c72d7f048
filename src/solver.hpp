#ifndef SOLVER_HPP
#define SOLVER_HPP

#include <vector>
#include <array>

#include "maxsat.hpp"

struct SolveResult {
    Assignment assignment;
    int score; // Number of satisfied clauses
    std::array<int, 3> phaseScores; // Global score after each phase
};

// Clause indices of each community, communities in order of first appearance
std::vector<std::vector<int>> communityMembers(const std::vector<int>& labels);

/*
    Phases of the community solver
    Every variable should be assigned prior to calling these functions
*/

// Phase 1: greedy best response per variable, largest communities first
Assignment applyCommunityPriority(const SatProblem&, const Assignment&, const std::vector<int>& labels);
// Phase 2: hill climbing restricted to the variables and clauses of each community
Assignment applyCommunityLocalSearch(const SatProblem&, const Assignment&, const std::vector<int>& labels,
    int maxSweeps = 50);
// Phase 3: first improving flip among variables of unsatisfied clauses, most frequent first
Assignment applyGlobalRefinement(const SatProblem&, const Assignment&, int maxIterations = 100);

SolveResult solveWithCommunities(const SatProblem&, const std::vector<int>& labels, Rng&);
SolveResult solveBaseline(const SatProblem&, int nbTrials, Rng&);

#endif
