#include <algorithm>
#include <stdexcept>

#include <gtest/gtest.h>

#include "solver.hpp"
#include "graph.hpp"
#include "community.hpp"
#include "test_util.hpp"

static int bestScore(const SatProblem& pb) {
    int best = 0;
    for (int mask = 0; mask < (1 << pb.nVars); mask++) {
        Assignment assign(pb.nVars);
        for (int iVar = 0; iVar < pb.nVars; iVar++) {
            assign[iVar] = (mask >> iVar) & 1;
        }
        best = std::max(best, pb.nbSatisfied(assign));
    }
    return best;
}

TEST(CommunityMembers, GroupsInOrderOfFirstAppearance) {
    auto members = communityMembers({2, 1, 2, 3, 1});
    ASSERT_EQ(members.size(), 3u);
    EXPECT_EQ(members[0], std::vector<int>({0, 2}));
    EXPECT_EQ(members[1], std::vector<int>({1, 4}));
    EXPECT_EQ(members[2], std::vector<int>({3}));
    EXPECT_TRUE(communityMembers({}).empty());
}

TEST(CommunityPriority, KeepsTheBetterValue) {
    SatProblem pb = makeProblem({{1}, {1}, {-1}}, 1);
    EXPECT_EQ(applyCommunityPriority(pb, {VAR_FALSE}, {1, 1, 1}), Assignment({VAR_TRUE}));
    pb = makeProblem({{-1}, {-1}, {1}}, 1);
    EXPECT_EQ(applyCommunityPriority(pb, {VAR_TRUE}, {1, 1, 1}), Assignment({VAR_FALSE}));
}

TEST(CommunityPriority, TiesFavourTrue) {
    SatProblem pb = makeProblem({{1}, {-1}}, 1);
    EXPECT_EQ(applyCommunityPriority(pb, {VAR_FALSE}, {1, 1}), Assignment({VAR_TRUE}));
}

TEST(CommunityPriority, LargestCommunityDecidesSharedVariables) {
    // Community 2 (two clauses) wants x1 false, community 1 (one clause) wants it true
    SatProblem pb = makeProblem({{1}, {-1}, {-1, 2}}, 2);
    Assignment assign = applyCommunityPriority(pb, {VAR_TRUE, VAR_FALSE}, {1, 2, 2});
    EXPECT_EQ(assign[0], VAR_FALSE);
}

TEST(CommunityPriority, UnusedVariablesAreUntouched) {
    SatProblem pb = makeProblem({{-1}}, 3);
    Assignment assign = applyCommunityPriority(pb, {VAR_TRUE, VAR_TRUE, VAR_FALSE}, {1});
    EXPECT_EQ(assign, Assignment({VAR_FALSE, VAR_TRUE, VAR_FALSE}));
}

TEST(CommunityLocalSearch, ClimbsWithinCommunity) {
    SatProblem pb = makeProblem({{1}, {2}, {-3}}, 3);
    Assignment start{VAR_FALSE, VAR_FALSE, VAR_TRUE};
    EXPECT_EQ(applyCommunityLocalSearch(pb, start, {1, 1, 2}), Assignment({VAR_TRUE, VAR_TRUE, VAR_FALSE}));
    EXPECT_EQ(applyCommunityLocalSearch(pb, start, {1, 1, 2}, 0), start);
}

TEST(CommunityLocalSearch, NeverCostsGlobalScore) {
    // Flipping x1 helps community 1 but breaks both clauses of community 2
    SatProblem pb = makeProblem({{1}, {-1}, {-1}}, 1);
    EXPECT_EQ(applyCommunityLocalSearch(pb, {VAR_FALSE}, {1, 2, 2}), Assignment({VAR_FALSE}));

    for (int seed = 0; seed < 10; seed++) {
        SatProblem random = randomProblem(30, 128, seed);
        auto labels = detectCommunities(buildConflictGraph(random, false, 1), 100, seed);
        Rng rng(seed);
        Assignment start = random.randomAssignment(rng);
        Assignment after = applyCommunityLocalSearch(random, start, labels);
        EXPECT_GE(random.nbSatisfied(after), random.nbSatisfied(start));
    }
}

TEST(GlobalRefinement, FlipsFirstImprovingVariable) {
    // x1 and x2 appear in two unsatisfied clauses each, flipping x1 loses
    SatProblem pb = makeProblem({{1, 2}, {1, 3}, {-1}, {-1}, {-1}, {2}}, 3);
    Assignment start{VAR_FALSE, VAR_FALSE, VAR_FALSE};
    EXPECT_EQ(applyGlobalRefinement(pb, start, 1), Assignment({VAR_FALSE, VAR_TRUE, VAR_FALSE}));
}

TEST(GlobalRefinement, MostFrequentVariableFirst) {
    SatProblem pb = makeProblem({{1}, {2}, {2}}, 2);
    Assignment start{VAR_FALSE, VAR_FALSE};
    EXPECT_EQ(applyGlobalRefinement(pb, start, 1), Assignment({VAR_FALSE, VAR_TRUE}));
    EXPECT_EQ(applyGlobalRefinement(pb, start, 2), Assignment({VAR_TRUE, VAR_TRUE}));
    EXPECT_EQ(applyGlobalRefinement(pb, start, 0), start);
}

TEST(GlobalRefinement, StopsAtLocalOptimum) {
    SatProblem pb = randomProblem(50, 218, 6);
    Rng rng(6);
    Assignment start = pb.randomAssignment(rng);
    Assignment assign = applyGlobalRefinement(pb, start, 100000);
    EXPECT_GE(pb.nbSatisfied(assign), pb.nbSatisfied(start));
    for (int iVar = 0; iVar < pb.nVars; iVar++) {
        EXPECT_LE(flipGain(pb, assign, iVar), 0) << "variable " << (iVar+1);
    }
}

TEST(SolveWithCommunities, SmallInstance) {
    SatProblem pb = makeProblem(smallInstance(), 3);
    // Every assignment falsifies at most one of these clauses, and three falsify none
    EXPECT_EQ(bestScore(pb), 5);

    auto labels = detectCommunities(buildConflictGraph(pb, false, 2));
    for (int seed = 0; seed < 20; seed++) {
        Rng rng(seed);
        SolveResult result = solveWithCommunities(pb, labels, rng);
        EXPECT_GE(result.score, 4);
        EXPECT_LE(result.score, 5);
        EXPECT_EQ(result.score, pb.nbSatisfied(result.assignment));
    }
}

TEST(SolveWithCommunities, PhasesNeverLoseClauses) {
    for (int seed = 0; seed < 10; seed++) {
        SatProblem pb = randomProblem(50, 218, 100+seed);
        for (bool weighted : {false, true}) {
            ClauseGraph graph = buildConflictGraph(pb, weighted, 2);
            auto labels = weighted ? weightedDetectCommunities(graph, 100, seed) : detectCommunities(graph, 100, seed);
            Rng rng(seed);
            SolveResult result = solveWithCommunities(pb, labels, rng);
            EXPECT_LE(result.phaseScores[0], result.phaseScores[1]);
            EXPECT_LE(result.phaseScores[1], result.phaseScores[2]);
            EXPECT_EQ(result.score, result.phaseScores[2]);
            EXPECT_EQ(result.score, pb.nbSatisfied(result.assignment));
            EXPECT_LE(result.score, pb.nClauses);
            EXPECT_EQ((int)result.assignment.size(), pb.nVars);
        }
    }
}

TEST(SolveWithCommunities, IsReproducible) {
    SatProblem pb = randomProblem(40, 170, 77);
    auto labels = detectCommunities(buildConflictGraph(pb, false, 2));
    Rng rng1(5), rng2(5);
    SolveResult first = solveWithCommunities(pb, labels, rng1);
    SolveResult second = solveWithCommunities(pb, labels, rng2);
    EXPECT_EQ(first.assignment, second.assignment);
    EXPECT_EQ(first.score, second.score);
}

TEST(SolveWithCommunities, DegenerateInputs) {
    Rng rng(1);
    SolveResult empty = solveWithCommunities(makeProblem({}, 0), {}, rng);
    EXPECT_TRUE(empty.assignment.empty());
    EXPECT_EQ(empty.score, 0);

    SolveResult noClauses = solveWithCommunities(makeProblem({}, 4), {}, rng);
    EXPECT_EQ(noClauses.assignment.size(), 4u);
    EXPECT_EQ(noClauses.score, 0);
}

TEST(SolveWithCommunities, RejectsMismatchedLabels) {
    SatProblem pb = makeProblem(smallInstance(), 3);
    Rng rng(1);
    EXPECT_THROW(solveWithCommunities(pb, {1, 1}, rng), std::invalid_argument);
}

TEST(SolveBaseline, KeepsBestRandomAssignment) {
    SatProblem pb = randomProblem(20, 91, 3);
    Rng rng(9);
    SolveResult result = solveBaseline(pb, 30, rng);
    EXPECT_EQ(result.score, pb.nbSatisfied(result.assignment));
    EXPECT_GE(result.score, 0);
    EXPECT_LE(result.score, pb.nClauses);

    Rng single(9);
    SolveResult once = solveBaseline(pb, 0, single);
    EXPECT_LE(once.score, result.score);
}
