#ifndef TEST_UTIL_HPP
#define TEST_UTIL_HPP

#include <vector>
#include <random>
#include <cstdlib>

#include "maxsat.hpp"

inline SatProblem makeProblem(const std::vector<std::vector<int>>& dimacsClauses, int nVars) {
    std::vector<Clause> clauses;
    for (const auto& lits : dimacsClauses) {
        clauses.push_back(clauseFromDimacs(lits));
    }
    return SatProblem(clauses, nVars);
}

// Uniform random 3-SAT, three distinct variables per clause
inline SatProblem randomProblem(int nVars, int nClauses, int seed) {
    Rng rng(seed);
    std::uniform_int_distribution<int> varDist(1, nVars);
    std::bernoulli_distribution signDist(0.5);
    std::vector<std::vector<int>> clauses;
    for (int iCls = 0; iCls < nClauses; iCls++) {
        std::vector<int> clause;
        while (clause.size() < 3) {
            int var = varDist(rng);
            bool seen = false;
            for (int lit : clause) {
                seen = seen || (std::abs(lit) == var);
            }
            if (!seen) {
                clause.push_back(signDist(rng) ? var : -var);
            }
        }
        clauses.push_back(clause);
    }
    return makeProblem(clauses, nVars);
}

// The 3 variables, 5 clauses instance used across tests
inline std::vector<std::vector<int>> smallInstance() {
    return {{1, 2, 3}, {-1, -2, 3}, {1, -2, -3}, {-1, 2, -3}, {-1, -2, -3}};
}

#endif
