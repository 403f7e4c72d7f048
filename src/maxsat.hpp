#ifndef MAXSAT_HPP
#define MAXSAT_HPP

#include <vector>
#include <functional>
#include <random>

using Rng = std::mt19937;

struct Literal {
    int varId;
    bool isTrue;

    static Literal fromDimacs(int lit);
    int toDimacs() const;
    Literal negated() const;
};

struct Clause {
    std::vector<Literal> literals;

    std::vector<Literal>::const_iterator begin() const { return literals.begin(); }
    std::vector<Literal>::const_iterator end() const { return literals.end(); }
    int size() const { return (int)literals.size(); }
    bool contains(const Literal&) const;
};

Clause clauseFromDimacs(const std::vector<int>& lits);

bool operator==(const Literal&, const Literal&);

using Value = signed char;
using Assignment = std::vector<Value>;

struct SatProblem {
    int nVars, nClauses;
    std::vector<Clause> clauses;
    std::vector<std::vector<int>> clausesUsingVar;

    SatProblem(const std::vector<Clause>& initClauses, int initNVars=0);

    Assignment freeAssignment() const;
    Assignment randomAssignment(Rng&) const;
    std::vector<int> unverifiedClauses(const Assignment&) const;
    int nbSatisfied(const Assignment&) const;
    int nbSatisfied(const Assignment&, const std::vector<int>& clauseIds) const;
};

const Value UNASSIGNED = -1;
const Value VAR_TRUE = 1;
const Value VAR_FALSE = 0;

bool isClauseSatisfied(const Clause&, const Assignment&);

// Change in the number of satisfied clauses if varId is flipped.
// Only the clauses accepted by the filter (all clauses if empty) are counted.
int flipGain(const SatProblem&, const Assignment&, int varId,
    const std::function<bool(int)>& clauseFilter = nullptr);

/*
    Assignment Heuristics
*/

Assignment assignAtRandom(const SatProblem&, const Assignment&, Rng&);

#endif
