#include <algorithm>
#include <numeric>
#include <map>
#include <string>
#include <stdexcept>

#include "solver.hpp"

using namespace std;

vector<vector<int>> communityMembers(const vector<int>& labels) {
    vector<vector<int>> members;
    map<int, int> communityOfLabel;
    for (int iCls = 0; iCls < (int)labels.size(); iCls++) {
        auto found = communityOfLabel.find(labels[iCls]);
        if (found == communityOfLabel.end()) {
            found = communityOfLabel.insert({labels[iCls], (int)members.size()}).first;
            members.push_back({});
        }
        members[found->second].push_back(iCls);
    }
    return members;
}

static vector<int> variablesOf(const SatProblem& pb, const vector<int>& clauseIds) {
    vector<int> vars;
    for (int iCls : clauseIds) {
        for (const Literal& lit : pb.clauses[iCls]) {
            vars.push_back(lit.varId);
        }
    }
    sort(vars.begin(), vars.end());
    vars.erase(unique(vars.begin(), vars.end()), vars.end());
    return vars;
}

// Index in communityMembers(labels) of the community of each clause
static vector<int> communityOfClauses(const vector<vector<int>>& members, int nClauses) {
    vector<int> communityOf(nClauses, -1);
    for (int iCom = 0; iCom < (int)members.size(); iCom++) {
        for (int iCls : members[iCom]) {
            communityOf[iCls] = iCom;
        }
    }
    return communityOf;
}


Assignment applyCommunityPriority(const SatProblem& pb, const Assignment& prevAssign, const vector<int>& labels) {
    auto assign = prevAssign;
    auto members = communityMembers(labels);
    auto communityOf = communityOfClauses(members, pb.nClauses);

    vector<int> order(members.size());
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(), [&members](int c1, int c2) -> bool {
        return members[c1].size() > members[c2].size();
    });

    // Variables shared with a larger community keep the value it chose
    vector<bool> isFixed(pb.nVars, false);
    for (int iCom : order) {
        auto inCommunity = [&communityOf, iCom](int iCls) { return communityOf[iCls] == iCom; };
        for (int iVar : variablesOf(pb, members[iCom])) {
            if (isFixed[iVar]) {
                continue;
            }
            // Only the clauses using the variable can differ between both values
            int scoreTrue = 0, scoreFalse = 0;
            for (int iCls : pb.clausesUsingVar[iVar]) {
                if (inCommunity(iCls)) {
                    assign[iVar] = VAR_TRUE;
                    scoreTrue += isClauseSatisfied(pb.clauses[iCls], assign);
                    assign[iVar] = VAR_FALSE;
                    scoreFalse += isClauseSatisfied(pb.clauses[iCls], assign);
                }
            }
            assign[iVar] = (scoreTrue >= scoreFalse) ? VAR_TRUE : VAR_FALSE;
            isFixed[iVar] = true;
        }
    }
    return assign;
}

Assignment applyCommunityLocalSearch(const SatProblem& pb, const Assignment& prevAssign, const vector<int>& labels,
        int maxSweeps) {
    auto assign = prevAssign;
    auto members = communityMembers(labels);
    auto communityOf = communityOfClauses(members, pb.nClauses);

    for (int iCom = 0; iCom < (int)members.size(); iCom++) {
        auto inCommunity = [&communityOf, iCom](int iCls) { return communityOf[iCls] == iCom; };
        vector<int> vars = variablesOf(pb, members[iCom]);

        for (int iSweep = 0; iSweep < maxSweeps; iSweep++) {
            bool improved = false;
            for (int iVar : vars) {
                // A flip must help the community without costing clauses elsewhere
                if (flipGain(pb, assign, iVar, inCommunity) > 0 && flipGain(pb, assign, iVar) >= 0) {
                    assign[iVar] = 1 - assign[iVar];
                    improved = true;
                }
            }
            if (!improved) {
                break;
            }
        }
    }
    return assign;
}

Assignment applyGlobalRefinement(const SatProblem& pb, const Assignment& prevAssign, int maxIterations) {
    auto assign = prevAssign;
    for (int iter = 0; iter < maxIterations; iter++) {
        vector<int> unverified = pb.unverifiedClauses(assign);
        if (unverified.empty()) { // All clauses are verified \o/
            break;
        }
        vector<int> frequency(pb.nVars, 0);
        for (int iCls : unverified) {
            for (int iVar : variablesOf(pb, {iCls})) {
                frequency[iVar]++;
            }
        }
        vector<int> candidates;
        for (int iVar = 0; iVar < pb.nVars; iVar++) {
            if (frequency[iVar] > 0) {
                candidates.push_back(iVar);
            }
        }
        stable_sort(candidates.begin(), candidates.end(), [&frequency](int v1, int v2) -> bool {
            return frequency[v1] > frequency[v2];
        });

        // First improvement, not best improvement
        int flipVar = -1;
        for (int iVar : candidates) {
            if (flipGain(pb, assign, iVar) > 0) {
                flipVar = iVar;
                break;
            }
        }
        if (flipVar < 0) { // Local optimum
            break;
        }
        assign[flipVar] = 1 - assign[flipVar];
    }
    return assign;
}


SolveResult solveWithCommunities(const SatProblem& pb, const vector<int>& labels, Rng& rng) {
    if ((int)labels.size() != pb.nClauses) {
        throw invalid_argument("expected one community label per clause, got " + to_string(labels.size())
            + " labels for " + to_string(pb.nClauses) + " clauses");
    }
    SolveResult result;
    auto assign = pb.randomAssignment(rng);

    assign = applyCommunityPriority(pb, assign, labels);
    result.phaseScores[0] = pb.nbSatisfied(assign);
    assign = applyCommunityLocalSearch(pb, assign, labels);
    result.phaseScores[1] = pb.nbSatisfied(assign);
    assign = applyGlobalRefinement(pb, assign);
    result.phaseScores[2] = pb.nbSatisfied(assign);

    result.assignment = assign;
    result.score = result.phaseScores[2];
    return result;
}

SolveResult solveBaseline(const SatProblem& pb, int nbTrials, Rng& rng) {
    SolveResult result;
    result.assignment = pb.randomAssignment(rng);
    result.score = pb.nbSatisfied(result.assignment);

    for (int iTrial = 0; iTrial < nbTrials; iTrial++) {
        auto assign = pb.randomAssignment(rng);
        int score = pb.nbSatisfied(assign);
        if (score > result.score) {
            result.score = score;
            result.assignment = assign;
        }
    }
    result.phaseScores = {result.score, result.score, result.score};
    return result;
}
