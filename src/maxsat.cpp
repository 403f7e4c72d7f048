#include <cstdlib>
#include <algorithm>
#include <vector>

#include "maxsat.hpp"

using namespace std;

Literal Literal::fromDimacs(int lit) {
    return Literal{abs(lit)-1, (lit > 0)};
}

int Literal::toDimacs() const {
    return isTrue ? (varId+1) : -(varId+1);
}

Literal Literal::negated() const {
    return Literal{varId, !isTrue};
}

bool operator==(const Literal& a, const Literal& b) {
    return a.varId == b.varId && a.isTrue == b.isTrue;
}

bool Clause::contains(const Literal& lit) const {
    return find(literals.begin(), literals.end(), lit) != literals.end();
}

Clause clauseFromDimacs(const vector<int>& lits) {
    Clause cls;
    for (int lit : lits) {
        cls.literals.push_back(Literal::fromDimacs(lit));
    }
    return cls;
}

SatProblem::SatProblem(const vector<Clause>& initClauses, int initNVars) {
    clauses = initClauses;
    nClauses = clauses.size();
    nVars = max(initNVars, 0);
    for (const Clause& cls: clauses) {
        for (const Literal& lit : cls) {
            nVars = max(nVars, lit.varId+1);
        }
    }

    clausesUsingVar = vector<vector<int>>(nVars, vector<int>());
    for (int iCls = 0; iCls < nClauses; iCls++) {
        for (const Literal& lit : clauses[iCls]) {
            vector<int>& using_ = clausesUsingVar[lit.varId];
            if (using_.empty() || using_.back() != iCls) { // A clause may repeat a variable
                using_.push_back(iCls);
            }
        }
    }
}

Assignment SatProblem::freeAssignment() const {
    return Assignment(this->nVars, UNASSIGNED);
}

Assignment SatProblem::randomAssignment(Rng& rng) const {
    return assignAtRandom(*this, this->freeAssignment(), rng);
}

bool isClauseSatisfied(const Clause& cls, const Assignment& assign) {
    for (const Literal& lit : cls) {
        if (assign[lit.varId] == lit.isTrue) {
            return true;
        }
    }
    return false;
}

vector<int> SatProblem::unverifiedClauses(const Assignment& assign) const {
    vector<int> unverified;
    for (int iCls = 0; iCls < (int)this->nClauses; iCls++) {
        if (!isClauseSatisfied(this->clauses[iCls], assign)) {
            unverified.push_back(iCls);
        }
    }
    return unverified;
}

int SatProblem::nbSatisfied(const Assignment& assign) const {
    return this->nClauses - (int)this->unverifiedClauses(assign).size();
}

int SatProblem::nbSatisfied(const Assignment& assign, const vector<int>& clauseIds) const {
    int satisfied = 0;
    for (int iCls : clauseIds) {
        if (isClauseSatisfied(this->clauses[iCls], assign)) {
            satisfied++;
        }
    }
    return satisfied;
}

int flipGain(const SatProblem& pb, const Assignment& assign, int varId,
        const function<bool(int)>& clauseFilter) {
    auto flipped = assign;
    flipped[varId] = 1 - flipped[varId];
    int gain = 0;
    for (int iCls : pb.clausesUsingVar[varId]) {
        if (clauseFilter && !clauseFilter(iCls)) {
            continue;
        }
        gain += isClauseSatisfied(pb.clauses[iCls], flipped);
        gain -= isClauseSatisfied(pb.clauses[iCls], assign);
    }
    return gain;
}


/*
    Assignment Heuristics
*/

Assignment assignAtRandom(const SatProblem& pb, const Assignment& prevAssign, Rng& rng) {
    auto assign = prevAssign;
    bernoulli_distribution coin(0.5);
    for (int iVar = 0; iVar < pb.nVars; iVar++) {
        if (assign[iVar] == UNASSIGNED) {
            assign[iVar] = coin(rng) ? VAR_TRUE : VAR_FALSE;
        }
    }
    return assign;
}
