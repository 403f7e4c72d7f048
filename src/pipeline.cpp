#include <iostream>
#include <chrono>

#include "pipeline.hpp"
#include "community.hpp"
#include "util.hpp"

using namespace std;

/*
    Settings
*/

PipelineSettings::PipelineSettings(){
    seed = 42;

    // Graph
    weighted = false;
    minConflicts = 2;
    weightFunction = "linear";

    // Label propagation
    maxIterations = 100;

    // Baseline (number of random assignments tried after the first one)
    baselineTrials = 100;

    debug = false;
}


PipelineResult runPipeline(const PipelineSettings& settings, const SatProblem& pb) {
    PipelineResult result;
    auto startClock = chrono::high_resolution_clock::now();

    WeightFunction weightFunction = weightFunctionByName(settings.weightFunction);
    ClauseGraph graph = buildConflictGraph(pb, settings.weighted, settings.minConflicts,
        weightFunction, settings.debug);
    result.nEdges = graph.nEdges();

    if (settings.weighted) {
        result.communities = weightedDetectCommunities(graph, settings.maxIterations, settings.seed);
    } else {
        result.communities = detectCommunities(graph, settings.maxIterations, settings.seed);
    }
    result.communitySizes = communitySizes(result.communities);
    if (settings.debug) {
        cerr << C_BLUE << "Communities: " << result.communities << C_RESET << endl;
    }

    Rng rng(settings.seed);
    result.solution = solveWithCommunities(pb, result.communities, rng);
    if (settings.debug) {
        cerr << C_BLUE << "Phase scores: " << result.solution.phaseScores[0] << " -> "
            << result.solution.phaseScores[1] << " -> " << result.solution.phaseScores[2] << C_RESET << endl;
    }

    auto stopClock = chrono::high_resolution_clock::now();
    auto runDuration = chrono::duration_cast<chrono::milliseconds>(stopClock - startClock);
    result.runTime = runDuration.count() / 1000.0;

    Rng baselineRng(settings.seed);
    result.baseline = solveBaseline(pb, settings.baselineTrials, baselineRng);
    return result;
}
